// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "neutron/logging.h"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace neutron {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> MakeDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_pattern(kDefaultLogPattern);
    return logger;
}

}  // namespace

LoggingOptions LoggingOptions::FromEnvironment() {
    LoggingOptions options;

    const char* level_env = std::getenv("NEUTRON_LOG_LEVEL");
    if (level_env && level_env[0] != '\0') {
        options.level = ParseLogLevel(level_env);
    }

    const char* pattern_env = std::getenv("NEUTRON_LOG_PATTERN");
    if (pattern_env && pattern_env[0] != '\0') {
        options.pattern = pattern_env;
    }

    return options;
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
    // from_str maps unknown names to off, so "off" is checked explicitly
    const std::string level_name(name);
    const auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        throw std::invalid_argument("Unknown log level: " + level_name);
    }
    return level;
}

std::shared_ptr<spdlog::logger> Logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = MakeDefaultLogger();
    }
    return g_logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

void InitLogging(const LoggingOptions& options) {
    auto logger = Logger();
    logger->set_level(options.level);
    logger->set_pattern(options.pattern);
    logger->debug("Logging initialized at level {}",
                  spdlog::level::to_string_view(options.level));
}

}  // namespace neutron
