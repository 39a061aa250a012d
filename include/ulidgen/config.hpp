#pragma once

#include <ulidgen/log.hpp>
#include <ulidgen/result.hpp>
#include <optional>
#include <string>

namespace ulidgen {

// How `ulidgen generate` prints each identifier
enum class OutputFormat {
    String,   // canonical 26-char base32
    Lower,    // base32, lowercase
    Hex,      // 32 hex digits
    Bytes,    // 16 space-separated byte values
    U128,     // decimal integer
};

const char* format_name(OutputFormat f);
std::optional<OutputFormat> parse_format(const std::string& name);

// Decimal count for `generate -n`: 1 through INT_MAX, else InvalidArg.
Result<int> parse_count(const std::string& text);

// Layered CLI configuration: global > project > explicit file > flags.
// Later layers override earlier ones, key by key.
struct Config {
    log::Level log_level = log::Info;
    bool color = true;
    int count = 1;
    OutputFormat format = OutputFormat::String;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool count_set = false;
    bool format_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);
};

// ~/.ulidgen/config.toml, or empty if HOME is unset
std::string global_config_path();

// ulidgen.toml in the working directory
std::string project_config_path();

} // namespace ulidgen
