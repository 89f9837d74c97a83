#ifndef ECR_UTILS_LOGGING_HPP
#define ECR_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ecr_utils
{

/// Timestamp, logger name, level and message, dash separated
inline constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S - %n - %l - %v";

/**
 * @brief Translate a numeric threshold (10 debug ... 50 critical) to spdlog
 *
 * A threshold between two named levels rounds up to the next one, so 15
 * hides debug messages. Values at or below 5 enable trace; above 50 logging
 * is off.
 */
spdlog::level::level_enum levelFromNumeric(int level);

/**
 * @brief Get or create a colored stdout logger with the service pattern
 *
 * An existing logger of the same name is reused and its level updated.
 */
std::shared_ptr<spdlog::logger> createLogger(const std::string& name,
                                             int numericLevel);

}  // namespace ecr_utils

#endif  // ECR_UTILS_LOGGING_HPP
