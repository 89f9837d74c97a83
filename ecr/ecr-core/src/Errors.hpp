#ifndef ECR_CORE_ERRORS_HPP
#define ECR_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ecr_core
{

/**
 * @brief No usable counter samples for an interval
 *
 * The interval is deferred and stays PENDING; it is never zero-filled.
 */
class InsufficientDataError final : public std::runtime_error
{
public:
  explicit InsufficientDataError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief A computed energy value failed the sanity bounds
 */
class ImplausibleReadingError final : public std::runtime_error
{
public:
  ImplausibleReadingError(const std::string& message, double value)
    : std::runtime_error(message), value_{value}
  {
  }

  [[nodiscard]] double value() const { return value_; }

private:
  double value_;
};

/**
 * @brief The time-series store could not be reached or answered garbage
 */
class SourceUnavailableError final : public std::runtime_error
{
public:
  explicit SourceUnavailableError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief The request ledger could not be read or updated
 */
class LedgerError final : public std::runtime_error
{
public:
  explicit LedgerError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

}  // namespace ecr_core

#endif  // ECR_CORE_ERRORS_HPP
