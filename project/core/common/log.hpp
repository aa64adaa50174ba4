// core/common/log.hpp
#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// Named spdlog channels shared by the simulator, input driver and app.
namespace logging {

extern const char* const kPattern;

// Creates the channels on one shared sink, a colored stderr sink unless
// `sink` is given. Only the first call has an effect.
void init(spdlog::level::level_enum level = spdlog::level::info,
          spdlog::sink_ptr sink = nullptr);

// Returns the named channel, or the default logger if it doesn't exist yet.
std::shared_ptr<spdlog::logger> get(const std::string& channel);

// "channel:level,channel2:level2", "*" addresses every channel.
void configure_from_string(const std::string& spec);

spdlog::level::level_enum parse_level(const std::string& s);

inline std::shared_ptr<spdlog::logger> physics() { return get("physics"); }
inline std::shared_ptr<spdlog::logger> sim()     { return get("sim"); }
inline std::shared_ptr<spdlog::logger> input()   { return get("input"); }
inline std::shared_ptr<spdlog::logger> config()  { return get("config"); }
inline std::shared_ptr<spdlog::logger> app()     { return get("app"); }

} // namespace logging
