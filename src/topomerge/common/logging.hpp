/**
 * @file logging.hpp
 * @brief The project logger, backed by spdlog.
 */
#pragma once
#include "topomerge/common/common.hpp"

#include <spdlog/spdlog.h>

namespace topomerge
{

class TopologyDiagnostics;

/**
 * @brief Configuration for the project logger.
 */
struct LoggingConfig
{
    /**
     * @brief Minimum level emitted by the logger.
     */
    spdlog::level::level_enum level{spdlog::level::info};

    /**
     * @brief spdlog pattern string for each line.
     */
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};

    /**
     * @brief Whether `SPDLOG_LEVEL` in the environment overrides `level`.
     */
    bool read_env_level{true};
};

namespace logging
{

/// Name of the project logger in the spdlog registry.
inline constexpr const char* logger_name = "topomerge";

/**
 * @brief Create (or reconfigure) the project logger.
 * @return The logger, also registered with spdlog under `logger_name`.
 */
std::shared_ptr<spdlog::logger> init(const LoggingConfig& config = LoggingConfig{});

/**
 * @brief Get the project logger, creating it with defaults if needed.
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Log the outcome of a topology validation.
 * @details One `warn` line per violation, or a single `info` line when valid.
 */
void log_diagnostics(const TopologyDiagnostics& diagnostics);

} // namespace logging

} // namespace topomerge
