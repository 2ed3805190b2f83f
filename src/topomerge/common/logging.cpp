/**
 * @file logging.cpp
 */
#include "topomerge/common/logging.hpp"
#include "topomerge/report/topology_diagnostics.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace topomerge
{
namespace logging
{

namespace
{
std::mutex g_init_mutex;
} // namespace

std::shared_ptr<spdlog::logger> init(const LoggingConfig& config)
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    auto logger = spdlog::get(logger_name);
    if (!logger)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>(logger_name, console_sink);
        spdlog::register_logger(logger);
    }
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    if (config.read_env_level)
    {
        // Applies SPDLOG_LEVEL, e.g. "debug" or "topomerge=trace".
        spdlog::cfg::load_env_levels();
    }
    return logger;
}

std::shared_ptr<spdlog::logger> get()
{
    auto logger = spdlog::get(logger_name);
    if (logger)
    {
        return logger;
    }
    return init();
}

void log_diagnostics(const TopologyDiagnostics& diagnostics)
{
    auto logger = get();
    if (diagnostics.is_valid())
    {
        logger->info("topology is consistent");
        return;
    }
    logger->warn("topology has {} violation(s)", diagnostics.errors().size());
    for (const auto& item : diagnostics.errors())
    {
        logger->warn("  [{}] {}", to_string(item.category), item.message);
    }
}

} // namespace logging
} // namespace topomerge
