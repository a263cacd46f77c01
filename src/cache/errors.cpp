#include "batch_cache/errors.hpp"

#include <string>

namespace batch_cache {

FetchContractViolation::FetchContractViolation(std::size_t requested,
                                               std::size_t returned)
    : std::logic_error("fetch returned " + std::to_string(returned) +
                       " values for " + std::to_string(requested) +
                       " missing keys"),
      requested_(requested), returned_(returned) {}

} // namespace batch_cache
