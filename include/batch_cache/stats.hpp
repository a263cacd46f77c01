#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace batch_cache {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  // Misses where the key was stored but past its expiry.
  std::uint64_t expired_reads{0};
  std::uint64_t inserts{0};
  std::uint64_t removals{0};
  std::uint64_t batch_requests{0};
  std::uint64_t fetch_calls{0};
  std::uint64_t fetched_keys{0};
  std::uint64_t fetch_failures{0};
};

std::string format_info(const CacheStats &stats, std::size_t stored,
                        std::optional<std::chrono::nanoseconds> expiry);

} // namespace batch_cache
