#include <dashgraph/config/config_loader.hpp>

#include <dashgraph/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace dashgraph {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, std::nullopt, ErrorCategory::Configuration};
}

Result<std::size_t, Error> ToCapacity(long long value, const std::string& source) {
    if (value < 0) {
        return Result<std::size_t, Error>::Err(MakeConfigError(
            source + " must not be negative, got " + std::to_string(value)));
    }
    return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        // -- Cache --
        if (root["cache"]) {
            const auto& cache = root["cache"];
            if (cache["capacity"]) {
                auto capacity = ToCapacity(cache["capacity"].as<long long>(), "cache.capacity");
                if (capacity.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(capacity).Error());
                }
                config.cache.capacity = capacity.Value();
            }
        }

        // -- Logging --
        if (root["log"]) {
            const auto& log = root["log"];
            if (log["level"]) {
                auto level = ParseLogLevel(log["level"].as<std::string>());
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Invalid log.level: " + level.Error().message));
                }
                config.log.level = level.Value();
            }
            if (log["format"]) {
                auto format = ParseLogFormat(log["format"].as<std::string>());
                if (format.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(format).Error());
                }
                config.log.format = format.Value();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("dashgraph", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--cache-capacity")
        .help("Maximum number of cached resource graphs")
        .scan<'i', long long>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-format")
        .help("console or json");
    program.add_argument("--log-file")
        .help("Log file path (default: stderr)");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverrides overrides;
    if (auto val = program.present<long long>("--cache-capacity")) {
        auto capacity = ToCapacity(*val, "--cache-capacity");
        if (capacity.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(capacity).Error());
        }
        overrides.cache_capacity = capacity.Value();
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + level.Error().message));
        }
        overrides.log_level = level.Value();
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (format.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(format).Error());
        }
        overrides.log_format = format.Value();
    }
    if (auto val = program.present("--log-file")) {
        overrides.log_file = *val;
    }

    if (auto path = program.present("--config")) {
        auto base = LoadFromYaml(*path);
        if (base.IsErr()) {
            return base;
        }
        return Result<AppConfig, Error>::Ok(MergeConfigs(base.Value(), overrides));
    }
    return Result<AppConfig, Error>::Ok(MergeConfigs(AppConfig{}, overrides));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const ConfigOverrides& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.cache_capacity.has_value()) {
        merged.cache.capacity = *cli_overrides.cache_capacity;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log.level = *cli_overrides.log_level;
    }
    if (cli_overrides.log_format.has_value()) {
        merged.log.format = *cli_overrides.log_format;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log.file = cli_overrides.log_file;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.cache.capacity == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Cache capacity must be positive, got 0"));
    }
    if (config.log.file.has_value() && config.log.file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Log file path is empty"));
    }
    return Result<void, Error>::Ok();
}

Result<LogFormat, Error> ParseLogFormat(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "console" || lower == "text") {
        return Result<LogFormat, Error>::Ok(LogFormat::Console);
    }
    if (lower == "json") {
        return Result<LogFormat, Error>::Ok(LogFormat::Json);
    }
    return Result<LogFormat, Error>::Err(
        MakeConfigError("Unknown log format '" + std::string(text) + "'"));
}

// ---------------------------------------------------------------------------
// InitLogging
// ---------------------------------------------------------------------------
Result<void, Error> InitLogging(const LogConfig& config) {
    const bool json = config.format == LogFormat::Json;

    std::unique_ptr<ILogSink> sink;
    if (config.file.has_value()) {
        auto stream = std::make_unique<std::ofstream>(*config.file, std::ios::app);
        if (!stream->good()) {
            return Result<void, Error>::Err(
                MakeConfigError("Cannot open log file: " + *config.file));
        }
        sink = std::make_unique<StreamOwningSink>(std::move(stream), json);
    } else if (json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ConsoleSink>(std::cerr);
    }

    InitGlobalLogger(std::move(sink), config.level);
    return Result<void, Error>::Ok();
}

} // namespace dashgraph
