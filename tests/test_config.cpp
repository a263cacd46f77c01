#include "batch_cache/cache.hpp"
#include "batch_cache/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace batch_cache;
using namespace std::chrono_literals;

TEST_CASE("config parses expiry_ms", "[config]") {
  CacheConfig cfg;
  std::string err;
  REQUIRE(parse_config(R"({"expiry_ms": 25})", cfg, &err));
  REQUIRE(cfg.expiry.has_value());
  CHECK(*cfg.expiry == 25ms);

  REQUIRE(parse_config(R"({"expiry_ms":null,"unknown":"x"})", cfg, &err));
  CHECK_FALSE(cfg.expiry.has_value());

  REQUIRE(parse_config("{}", cfg, &err));
  CHECK_FALSE(cfg.expiry.has_value());
}

TEST_CASE("config rejects malformed input", "[config][adversarial]") {
  CacheConfig cfg;
  cfg.expiry = 5ms;
  std::string err;
  CHECK_FALSE(parse_config("expiry_ms=5", cfg, &err));
  CHECK(err == "invalid schema");

  CHECK_FALSE(parse_config(R"({"expiry_ms": -3})", cfg, &err));
  CHECK(err == "invalid expiry_ms");
  CHECK_FALSE(parse_config(R"({"expiry_ms": 1.5})", cfg, &err));
  CHECK_FALSE(parse_config(R"({"expiry_ms": "10"})", cfg, &err));
  // Failed parses leave the previous config in place.
  REQUIRE(cfg.expiry.has_value());
  CHECK(*cfg.expiry == 5ms);

  CHECK_FALSE(load_config("does/not/exist.json", cfg, &err));
  CHECK(err == "config file not found");
}

TEST_CASE("config rejects expiry beyond the clock range",
          "[config][adversarial]") {
  CacheConfig cfg;
  std::string err;
  CHECK_FALSE(parse_config(R"({"expiry_ms": 10000000000000})", cfg, &err));
  CHECK(err == "invalid expiry_ms");
  CHECK_FALSE(cfg.expiry.has_value());
  CHECK_FALSE(
      parse_config(R"({"expiry_ms": 18446744073709551615})", cfg, &err));
  CHECK_FALSE(
      parse_config(R"({"expiry_ms": 99999999999999999999999})", cfg, &err));

  const std::string max_ms = std::to_string(max_expiry_ms());
  REQUIRE(parse_config("{\"expiry_ms\": " + max_ms + "}", cfg, &err));
  REQUIRE(cfg.expiry.has_value());
  CHECK(static_cast<std::uint64_t>(cfg.expiry->count()) == max_expiry_ms());

  Cache<int, int> c(cfg);
  REQUIRE(c.expiry().has_value());
  CHECK(c.expiry()->count() > 0);
  c.insert(1, 1);
  CHECK(c.get(1) != nullptr);
}

TEST_CASE("command line expiry is validated", "[config][adversarial]") {
  CacheConfig cfg;
  std::string err;
  REQUIRE(parse_expiry_ms("250", cfg, &err));
  REQUIRE(cfg.expiry.has_value());
  CHECK(*cfg.expiry == 250ms);

  CHECK_FALSE(parse_expiry_ms("-5", cfg, &err));
  CHECK(err == "invalid expiry_ms");
  CHECK_FALSE(parse_expiry_ms("5,6", cfg, &err));
  CHECK_FALSE(parse_expiry_ms("", cfg, &err));
  CHECK_FALSE(parse_expiry_ms("10000000000000", cfg, &err));
  CHECK(*cfg.expiry == 250ms);
}

TEST_CASE("cache built from a config file expires entries", "[config][ttl]") {
  const char *path = "batch_cache_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"expiry_ms": 30})";
  }
  CacheConfig cfg;
  std::string err;
  REQUIRE(load_config(path, cfg, &err));
  std::remove(path);

  Cache<int, int> c(cfg);
  REQUIRE(c.expiry().has_value());
  CHECK(*c.expiry() == 30ms);
  c.insert(1, 1);
  CHECK(c.get(1) != nullptr);
  std::this_thread::sleep_for(60ms);
  CHECK(c.get(1) == nullptr);
}

TEST_CASE("info reports counters", "[stats]") {
  auto c = Cache<int, int>::with_expiry_duration(100ms);
  c.insert(1, 1);
  c.entries({1, 2, 3}).or_insert_with(
      [](const std::vector<int> &ids) { return std::vector<int>(ids.size(), 0); });
  c.get(4);
  c.remove(1);

  const std::string info = c.info();
  CHECK(info.find("expiry_ms:100\n") != std::string::npos);
  CHECK(info.find("keys:2\n") != std::string::npos);
  CHECK(info.find("hits:1\n") != std::string::npos);
  CHECK(info.find("misses:3\n") != std::string::npos);
  CHECK(info.find("inserts:3\n") != std::string::npos);
  CHECK(info.find("removals:1\n") != std::string::npos);
  CHECK(info.find("batch_requests:1\n") != std::string::npos);
  CHECK(info.find("fetch_calls:1\n") != std::string::npos);
  CHECK(info.find("fetched_keys:2\n") != std::string::npos);

  Cache<int, int> forever;
  CHECK(forever.info().find("expiry_ms:none\n") != std::string::npos);
}
