#include <ulidgen/config.hpp>
#include <toml++/toml.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ulidgen {

const char* format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::String: return "string";
        case OutputFormat::Lower:  return "lower";
        case OutputFormat::Hex:    return "hex";
        case OutputFormat::Bytes:  return "bytes";
        case OutputFormat::U128:   return "u128";
    }
    return "unknown";
}

std::optional<OutputFormat> parse_format(const std::string& name) {
    if (name == "string") return OutputFormat::String;
    if (name == "lower") return OutputFormat::Lower;
    if (name == "hex") return OutputFormat::Hex;
    if (name == "bytes") return OutputFormat::Bytes;
    if (name == "u128") return OutputFormat::U128;
    return std::nullopt;
}

Result<int> parse_count(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || n < 1) {
        return UlidError{UlidError::InvalidArg,
            "invalid count '" + text + "'",
            "the count must be a positive integer"};
    }
    if (errno == ERANGE || n > INT_MAX) {
        return UlidError{UlidError::InvalidArg,
            "count '" + text + "' is too large",
            "the count must be at most " + std::to_string(INT_MAX)};
    }
    return Result<int>::ok(static_cast<int>(n));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto node = (*log_tbl)["level"]) {
            auto s = node.as_string();
            if (!s) {
                return UlidError{UlidError::Config, "log.level must be a string"};
            }
            auto lvl = log::parse_level(s->get());
            if (!lvl) {
                return UlidError{UlidError::Config,
                    "unknown log level '" + s->get() + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto node = (*log_tbl)["color"]) {
            auto b = node.as_boolean();
            if (!b) {
                return UlidError{UlidError::Config, "log.color must be a boolean"};
            }
            cfg.color = b->get();
            cfg.color_set = true;
        }
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto node = (*gen)["count"]) {
            auto n = node.as_integer();
            if (!n || n->get() < 1) {
                return UlidError{UlidError::Config,
                    "generate.count must be a positive integer"};
            }
            if (n->get() > INT_MAX) {
                return UlidError{UlidError::Config,
                    "generate.count " + std::to_string(n->get()) + " is too large",
                    "the count must be at most " + std::to_string(INT_MAX)};
            }
            cfg.count = static_cast<int>(n->get());
            cfg.count_set = true;
        }
        if (auto node = (*gen)["format"]) {
            auto s = node.as_string();
            if (!s) {
                return UlidError{UlidError::Config, "generate.format must be a string"};
            }
            auto f = parse_format(s->get());
            if (!f) {
                return UlidError{UlidError::Config,
                    "unknown output format '" + s->get() + "'",
                    "expected one of: string, lower, hex, bytes, u128"};
            }
            cfg.format = *f;
            cfg.format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.count_set) {
        count = other.count;
        count_set = true;
    }
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulidgen/config.toml";
}

std::string project_config_path() {
    return "ulidgen.toml";
}

} // namespace ulidgen
