#ifndef __LOGGING_HPP___
#define __LOGGING_HPP___

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @file logging.hpp
 * @brief Shared spdlog logger for the solvers and command-line tools.
 */

/**
 * @brief The `waffle` logger, writing colored output to stderr.
 *
 * Created on first use with level `warn`, so stdout stays reserved for
 * solver output.
 */
std::shared_ptr<spdlog::logger> waffle_logger();

/**
 * @brief Set the level of the `waffle` logger from its name (trace, debug,
 * info, warn, error, critical, off).
 *
 * @throws std::invalid_argument on an unknown level name.
 */
void set_log_level(const std::string& level);

#endif // __LOGGING_HPP___
