// ==============================================================================
// config.cpp - MOD-0013: Application Configuration Implementation
// ==============================================================================

#include <unifilter/config.hpp>
#include <unifilter/platform.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace unifilter::config {

std::string to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Quiet:
        return "quiet";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "info";
}

LogLevel parse_log_level(std::string_view s) {
    std::string lower(s);
    for (auto& c : lower) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    if (lower == "quiet" || lower == "error")
        return LogLevel::Quiet;
    if (lower == "info" || lower == "warning" || lower == "warn")
        return LogLevel::Info;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "trace")
        return LogLevel::Trace;
    throw std::invalid_argument("unknown log level '" + std::string(s) +
                                "', must be: quiet, info, debug or trace");
}

std::string ConfigError::format() const {
    if (path.empty()) {
        return "config error: " + message;
    }
    return "config error [" + path + "]: " + message;
}

namespace {

void apply_settings(const YAML::Node& settings, AppConfig& cfg) {
    if (!settings || settings.IsNull()) {
        return;
    }
    if (!settings.IsMap()) {
        throw std::runtime_error("'settings' must be a mapping");
    }

    if (settings["log_level"]) {
        cfg.log_level = parse_log_level(settings["log_level"].as<std::string>());
    }
    if (settings["output_file"]) {
        cfg.output_file = platform::path_from_utf8(settings["output_file"].as<std::string>());
    }
    if (settings["report_file"] && !settings["report_file"].IsNull()) {
        cfg.report_file = platform::path_from_utf8(settings["report_file"].as<std::string>());
    }
    if (settings["max_processing_workers"]) {
        long long workers = settings["max_processing_workers"].as<long long>();
        if (workers < 0) {
            throw std::runtime_error("max_processing_workers must not be negative");
        }
        cfg.max_processing_workers = static_cast<std::size_t>(workers);
    }
    if (settings["translation_strategy"]) {
        cfg.translation_strategy =
            rule::parse_strategy(settings["translation_strategy"].as<std::string>());
    }
    if (settings["patterns_dir"]) {
        cfg.patterns_dir = platform::path_from_utf8(settings["patterns_dir"].as<std::string>());
    }
    cfg.list_title = settings["list_title"].as<std::string>(cfg.list_title);
    cfg.list_version = settings["list_version"].as<std::string>(cfg.list_version);
}

void apply_filter_lists(const YAML::Node& lists, AppConfig& cfg) {
    if (!lists || lists.IsNull()) {
        return;
    }
    if (!lists.IsMap()) {
        throw std::runtime_error("'filter_lists' must be a mapping of name to path");
    }

    for (const auto& entry : lists) {
        std::string name = entry.first.as<std::string>();
        std::string path =
            entry.second.IsScalar() ? entry.second.as<std::string>() : std::string();
        if (path.empty()) {
            throw std::runtime_error("filter list '" + name + "' has no path");
        }
        cfg.filter_lists.push_back(FilterListSource{name, platform::path_from_utf8(path)});
    }
}

}  // namespace

ConfigResult parse_config(std::string_view content, std::string_view source) {
    ConfigResult result;

    try {
        YAML::Node root = YAML::Load(std::string(content));

        if (root.IsNull()) {
            result.ok = true;
            result.config.from_file = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = ConfigError{"configuration root must be a mapping", std::string(source)};
            return result;
        }

        apply_settings(root["settings"], result.config);
        apply_filter_lists(root["filter_lists"], result.config);
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), std::string(source)};
        return result;
    } catch (const std::exception& e) {
        result.error = ConfigError{e.what(), std::string(source)};
        return result;
    }

    result.config.from_file = true;
    result.ok = true;
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    const std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ConfigResult result;
        result.ok = true;
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        ConfigResult result;
        result.error = ConfigError{"failed to open configuration file", path_str};
        return result;
    }
    std::ostringstream content;
    content << in.rdbuf();

    return parse_config(content.str(), path_str);
}

}  // namespace unifilter::config
