// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace neutron {

inline constexpr char kLoggerName[] = "neutron";
inline constexpr char kDefaultLogPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

/**
 * @brief Logging settings for the identifier and status helpers
 *
 * Environment Variables:
 * - NEUTRON_LOG_LEVEL: trace, debug, info, warning, error, critical or off (default: info)
 * - NEUTRON_LOG_PATTERN: spdlog pattern (default: kDefaultLogPattern)
 */
struct LoggingOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{kDefaultLogPattern};

    /**
     * @brief Read options from the environment, falling back to defaults
     * @throws std::invalid_argument if NEUTRON_LOG_LEVEL names no level
     */
    static LoggingOptions FromEnvironment();
};

/**
 * @brief Parse a spdlog level name; "warn" and "err" are accepted as aliases
 * @throws std::invalid_argument for an unknown name
 */
spdlog::level::level_enum ParseLogLevel(std::string_view name);

/**
 * @brief Logger used by every helper in this library
 *
 * Defaults to a colour stdout logger named kLoggerName. Thread-safe.
 */
std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Replace the logger, e.g. with one writing to a test sink
 * @param logger New logger; nullptr restores the default
 */
void SetLogger(std::shared_ptr<spdlog::logger> logger);

/**
 * @brief Apply level and pattern to the current logger
 */
void InitLogging(const LoggingOptions& options);

}  // namespace neutron
