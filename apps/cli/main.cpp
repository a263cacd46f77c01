#include "batch_cache/cache.hpp"
#include "batch_cache/config.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Stand-in for a daisy-chained motor bus where one sync-read frame returns a
// register for several motors at once.
struct SimulatedBus {
  double fail_rate{0.0};
  std::mt19937_64 rng{42};
  std::uniform_real_distribution<double> dist{0.0, 1.0};
  std::uint64_t frames{0};

  std::optional<std::vector<double>> sync_read(const std::vector<int> &ids,
                                               std::string *err) {
    ++frames;
    if (dist(rng) < fail_rate) {
      if (err)
        *err = "bus timeout";
      return std::nullopt;
    }
    std::vector<double> values;
    values.reserve(ids.size());
    for (int id : ids)
      values.push_back(id * 10.0 + static_cast<double>(frames) / 100.0);
    return values;
  }
};

bool parse_ids(std::istringstream &in, std::vector<int> &out) {
  std::string tok;
  while (in >> tok) {
    try {
      std::size_t idx = 0;
      out.push_back(std::stoi(tok, &idx));
      if (idx != tok.size())
        return false;
    } catch (const std::exception &) {
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  batch_cache::CacheConfig cfg;
  double fail_rate = 0.0;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      std::string err;
      if (!batch_cache::load_config(argv[++i], cfg, &err)) {
        std::cerr << "config: " << err << "\n";
        return 1;
      }
    } else if (a == "--expiry-ms" && i + 1 < argc) {
      std::string err;
      if (!batch_cache::parse_expiry_ms(argv[++i], cfg, &err)) {
        std::cerr << "--expiry-ms: " << err << "\n";
        return 1;
      }
    } else if (a == "--fail-rate" && i + 1 < argc) {
      fail_rate = std::stod(argv[++i]);
    }
  }

  batch_cache::Cache<int, double> cache(cfg);
  SimulatedBus bus;
  bus.fail_rate = fail_rate;

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd))
      continue;
    if (cmd == "quit")
      break;

    if (cmd == "get") {
      std::vector<int> ids;
      if (!parse_ids(in, ids) || ids.empty()) {
        std::cout << "ERR usage: get <id>...\n";
        continue;
      }
      std::string err;
      auto values = cache.entries(ids).or_try_insert_with(
          [&](const std::vector<int> &missing, std::string *e) {
            return bus.sync_read(missing, e);
          },
          &err);
      if (!values.has_value()) {
        std::cout << "ERR " << err << "\n";
        continue;
      }
      for (std::size_t i = 0; i < ids.size(); ++i)
        std::cout << ids[i] << "=" << *(*values)[i]
                  << (i + 1 < ids.size() ? " " : "\n");
    } else if (cmd == "set") {
      int id = 0;
      double v = 0.0;
      if (!(in >> id >> v)) {
        std::cout << "ERR usage: set <id> <value>\n";
        continue;
      }
      cache.insert(id, v);
      std::cout << "OK\n";
    } else if (cmd == "del") {
      int id = 0;
      if (!(in >> id)) {
        std::cout << "ERR usage: del <id>\n";
        continue;
      }
      auto old = cache.remove(id);
      if (old.has_value())
        std::cout << *old << "\n";
      else
        std::cout << "(nil)\n";
    } else if (cmd == "info") {
      std::cout << cache.info() << "bus_frames:" << bus.frames << "\n";
    } else {
      std::cout << "ERR unknown command '" << cmd << "'\n";
    }
  }
  return 0;
}
