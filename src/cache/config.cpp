#include "batch_cache/config.hpp"
#include "batch_cache/types.hpp"

#include <cstdint>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <sstream>

namespace batch_cache {
namespace {
bool has_key(const std::string &text, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:");
  return std::regex_search(text, re);
}
bool extract_null(const std::string &text, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*null\\b");
  return std::regex_search(text, re);
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)\\s*[,}]");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}
bool set_expiry(std::uint64_t ms, CacheConfig &cfg, std::string *err) {
  if (ms > max_expiry_ms()) {
    if (err)
      *err = "invalid expiry_ms";
    return false;
  }
  cfg.expiry = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
  return true;
}
} // namespace

std::uint64_t max_expiry_ms() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max())
          .count());
}

bool parse_expiry_ms(const std::string &text, CacheConfig &cfg,
                     std::string *err) {
  std::uint64_t ms = 0;
  bool ok = std::regex_match(text, std::regex("[0-9]+"));
  if (ok) {
    try {
      ms = static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range &) {
      ok = false;
    }
  }
  if (!ok) {
    if (err)
      *err = "invalid expiry_ms";
    return false;
  }
  return set_expiry(ms, cfg, err);
}

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig cfg;
  if (has_key(text, "expiry_ms") && !extract_null(text, "expiry_ms")) {
    std::uint64_t ms = 0;
    if (!extract_u64(text, "expiry_ms", ms)) {
      if (err)
        *err = "invalid expiry_ms";
      return false;
    }
    if (!set_expiry(ms, cfg, err))
      return false;
  }
  out = cfg;
  return true;
}

bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), out, err);
}

} // namespace batch_cache
