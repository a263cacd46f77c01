#include "batch_cache/stats.hpp"

#include <sstream>

namespace batch_cache {

std::string format_info(const CacheStats &stats, std::size_t stored,
                        std::optional<std::chrono::nanoseconds> expiry) {
  std::ostringstream os;
  if (expiry.has_value())
    os << "expiry_ms:"
       << std::chrono::duration<double, std::milli>(*expiry).count() << "\n";
  else
    os << "expiry_ms:none\n";
  os << "keys:" << stored << "\n";
  os << "hits:" << stats.hits << "\n";
  os << "misses:" << stats.misses << "\n";
  os << "expired_reads:" << stats.expired_reads << "\n";
  os << "inserts:" << stats.inserts << "\n";
  os << "removals:" << stats.removals << "\n";
  os << "batch_requests:" << stats.batch_requests << "\n";
  os << "fetch_calls:" << stats.fetch_calls << "\n";
  os << "fetched_keys:" << stats.fetched_keys << "\n";
  os << "fetch_failures:" << stats.fetch_failures << "\n";
  return os.str();
}

} // namespace batch_cache
