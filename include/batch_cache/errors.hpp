#pragma once

#include <cstddef>
#include <stdexcept>

namespace batch_cache {

// Thrown when a fetch callback reports success but returns a number of
// values different from the number of keys it was asked for. Nothing is
// inserted when this is raised.
class FetchContractViolation : public std::logic_error {
public:
  FetchContractViolation(std::size_t requested, std::size_t returned);

  std::size_t requested() const { return requested_; }
  std::size_t returned() const { return returned_; }

private:
  std::size_t requested_;
  std::size_t returned_;
};

} // namespace batch_cache
