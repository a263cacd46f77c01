#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace batch_cache {

struct CacheConfig {
  // Absent means entries never go stale.
  std::optional<std::chrono::milliseconds> expiry{};
};

// Longest expiry the steady clock can represent, in milliseconds.
std::uint64_t max_expiry_ms();

// Sets cfg.expiry from a millisecond count given as text, as taken from a
// command line. Rejects signs, fractions and values above max_expiry_ms().
bool parse_expiry_ms(const std::string &text, CacheConfig &cfg,
                     std::string *err = nullptr);

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err = nullptr);
bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err = nullptr);

} // namespace batch_cache
