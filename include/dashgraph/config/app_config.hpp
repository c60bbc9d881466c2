#pragma once

#include <dashgraph/core/log.hpp>
#include <dashgraph/resourceviewer/component_cache.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace dashgraph {

enum class LogFormat {
    Console,
    Json,
};

struct CacheConfig {
    std::size_t capacity = kDefaultComponentCacheCapacity;
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Console;
    std::optional<std::string> file;  // stderr when unset
};

struct AppConfig {
    CacheConfig cache;
    LogConfig log;
};

// Values given explicitly on the command line; unset fields keep the base.
struct ConfigOverrides {
    std::optional<std::size_t> cache_capacity;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
};

} // namespace dashgraph
