// core/common/log.cpp
#include "log.hpp"

#include <sstream>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace logging {

static const char* kChannels[] = { "physics", "sim", "input", "config", "app" };

const char* const kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

static bool g_initialized = false;

void init(spdlog::level::level_enum level, spdlog::sink_ptr sink)
{
    if (g_initialized) {
        return;
    }

    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    // loggers built by hand don't pick up the registry formatter
    sink->set_pattern(kPattern);

    for (const char* name : kChannels) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_level(level);
        spdlog::register_logger(logger);
    }

    auto default_logger = std::make_shared<spdlog::logger>("default", sink);
    default_logger->set_level(level);
    spdlog::set_default_logger(default_logger);

    g_initialized = true;
}

std::shared_ptr<spdlog::logger> get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

spdlog::level::level_enum parse_level(const std::string& s)
{
    if (s == "trace")                   return spdlog::level::trace;
    if (s == "debug")                   return spdlog::level::debug;
    if (s == "info")                    return spdlog::level::info;
    if (s == "warn" || s == "warning")  return spdlog::level::warn;
    if (s == "error" || s == "err")     return spdlog::level::err;
    if (s == "critical")                return spdlog::level::critical;
    if (s == "off")                     return spdlog::level::off;

    spdlog::warn("unknown log level '{}', using info", s);
    return spdlog::level::info;
}

void configure_from_string(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("ignoring log spec entry '{}' (expected channel:level)", item);
            continue;
        }
        const std::string channel = item.substr(0, colon);
        const auto level = parse_level(item.substr(colon + 1));

        if (channel == "*") {
            spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& l) {
                l->set_level(level);
            });
        } else if (auto logger = spdlog::get(channel)) {
            logger->set_level(level);
        } else {
            spdlog::warn("unknown log channel '{}'", channel);
        }
    }
}

} // namespace logging
