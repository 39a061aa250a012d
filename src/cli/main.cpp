// ulidgen: command-line front end for the ULID library.
//
//     ulidgen generate [-n COUNT] [--format string|lower|hex|bytes|u128]
//     ulidgen inspect <ULID>
//     ulidgen canonicalize <STRING>
//     ulidgen validate <STRING>
//
// Global flags: -v/--verbose, -q/--quiet, --no-color, --config <path>.
// Exit codes: 0 success, 1 operation error, 2 usage error.

#include <ulidgen/base32.hpp>
#include <ulidgen/config.hpp>
#include <ulidgen/log.hpp>
#include <ulidgen/timefmt.hpp>
#include <ulidgen/ulid.hpp>

#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ulidgen;

namespace {

constexpr int EXIT_OP_ERROR = 1;
constexpr int EXIT_USAGE = 2;

const char* USAGE =
    "usage: ulidgen [-v|-q] [--no-color] [--config <path>] <command> [args]\n"
    "\n"
    "commands:\n"
    "  generate [-n COUNT] [--format FMT]   print new ULIDs (FMT: string, lower, hex, bytes, u128)\n"
    "  inspect <ULID>                       show the parts of a ULID\n"
    "  canonicalize <STRING>                print the canonical form of a ULID string\n"
    "  validate <STRING>                    check a ULID string, exit 1 if invalid\n";

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::string config_path;
    Config flags;  // only the *_set fields coming from the command line
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need_value = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return UlidError{UlidError::InvalidArg,
                    std::string("missing value for ") + flag};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "-v" || a == "--verbose") {
            args.flags.log_level = log::Debug;
            args.flags.log_level_set = true;
        } else if (a == "-q" || a == "--quiet") {
            args.flags.log_level = log::Error;
            args.flags.log_level_set = true;
        } else if (a == "--no-color") {
            args.flags.color = false;
            args.flags.color_set = true;
        } else if (a == "--config") {
            auto v = need_value("--config");
            ULIDGEN_TRY(v);
            args.config_path = v.value();
        } else if (a == "-n" || a == "--count") {
            auto v = need_value("-n");
            ULIDGEN_TRY(v);
            auto n = parse_count(v.value());
            ULIDGEN_TRY(n);
            args.flags.count = n.value();
            args.flags.count_set = true;
        } else if (a == "-f" || a == "--format") {
            auto v = need_value("--format");
            ULIDGEN_TRY(v);
            auto f = parse_format(v.value());
            if (!f) {
                return UlidError{UlidError::InvalidArg,
                    "unknown output format '" + v.value() + "'",
                    "expected one of: string, lower, hex, bytes, u128"};
            }
            args.flags.format = *f;
            args.flags.format_set = true;
        } else if (a == "-h" || a == "--help") {
            args.command = "help";
        } else if (!a.empty() && a[0] == '-' && a != "-") {
            return UlidError{UlidError::InvalidArg, "unknown option '" + a + "'"};
        } else if (args.command.empty()) {
            args.command = a;
        } else {
            args.positional.push_back(a);
        }
    }

    if (args.command.empty()) {
        return UlidError{UlidError::InvalidArg, "no command given",
            "run 'ulidgen --help' for usage"};
    }
    return Result<Args>::ok(std::move(args));
}

// Missing default files are fine; an explicit --config must exist.
Result<Config> load_config(const Args& args) {
    std::optional<Config> global, project, explicit_file;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto r = Config::load(gpath);
        ULIDGEN_TRY(r);
        global = r.value();
    }
    std::string ppath = project_config_path();
    if (fs::exists(ppath)) {
        auto r = Config::load(ppath);
        ULIDGEN_TRY(r);
        project = r.value();
    }
    if (!args.config_path.empty()) {
        auto r = Config::load(args.config_path);
        ULIDGEN_TRY(r);
        explicit_file = r.value();
    }

    Config cfg = Config::effective(global, project, explicit_file);
    cfg.merge(args.flags);
    return Result<Config>::ok(std::move(cfg));
}

std::string bytes_string(const std::array<uint8_t, 16>& bytes) {
    std::string out;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out += ' ';
        out += std::to_string(bytes[i]);
    }
    return out;
}

std::string render(const Ulid& u, OutputFormat format) {
    switch (format) {
        case OutputFormat::String:
            return u.to_string();
        case OutputFormat::Lower: {
            std::string s = u.to_string();
            for (auto& c : s) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return s;
        }
        case OutputFormat::Hex:
            return to_hex(u.to_u128(), 32);
        case OutputFormat::Bytes:
            return bytes_string(u.to_bytes());
        case OutputFormat::U128:
            return to_decimal(u.to_u128());
    }
    return u.to_string();
}

Result<std::string> single_arg(const Args& args) {
    if (args.positional.size() != 1) {
        return UlidError{UlidError::InvalidArg,
            "'" + args.command + "' takes exactly one argument"};
    }
    return Result<std::string>::ok(args.positional[0]);
}

int report(const UlidError& e) {
    std::cerr << e.format() << "\n";
    return EXIT_OP_ERROR;
}

int cmd_generate(const Args& args, const Config& cfg) {
    if (!args.positional.empty()) {
        std::cerr << "error: 'generate' takes no positional arguments\n";
        return EXIT_USAGE;
    }
    log::debug("generating %d ULID(s) as %s", cfg.count, format_name(cfg.format));
    for (int i = 0; i < cfg.count; ++i) {
        auto u = Ulid::try_generate();
        if (!u) {
            log::error("no ULID could be generated after %d of %d", i, cfg.count);
            return EXIT_OP_ERROR;
        }
        std::cout << render(*u, cfg.format) << "\n";
    }
    return 0;
}

int cmd_inspect(const Args& args) {
    auto arg = single_arg(args);
    if (arg.is_err()) {
        std::cerr << arg.error().format() << "\n";
        return EXIT_USAGE;
    }
    auto parsed = ZeroableUlid::parse(arg.value());
    if (parsed.is_err()) return report(parsed.error());

    const ZeroableUlid& u = parsed.value();
    std::cout << "string:     " << u.to_string() << "\n"
              << "timestamp:  " << format_timestamp(u.timestamp())
              << " (" << u.timestamp() << " ms)\n"
              << "randomness: " << to_hex(u.randomness(), 20) << "\n"
              << "u128:       " << to_decimal(u.to_u128()) << "\n"
              << "bytes:      " << bytes_string(u.to_bytes()) << "\n";
    if (u.is_zero()) {
        log::warn("this is the zero ULID");
    }
    return 0;
}

int cmd_canonicalize(const Args& args) {
    auto arg = single_arg(args);
    if (arg.is_err()) {
        std::cerr << arg.error().format() << "\n";
        return EXIT_USAGE;
    }
    auto c = base32::canonicalize(arg.value());
    if (c.is_err()) return report(c.error());

    log::debug("%s", c.value().is_borrowed() ? "input already canonical" : "input rewritten");
    std::cout << c.value().view() << "\n";
    return 0;
}

int cmd_validate(const Args& args) {
    auto arg = single_arg(args);
    if (arg.is_err()) {
        std::cerr << arg.error().format() << "\n";
        return EXIT_USAGE;
    }
    auto s = base32::validate(arg.value());
    if (s.is_err()) return report(s.error());
    log::info("valid");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return EXIT_USAGE;
    }
    if (args.value().command == "help") {
        std::cout << USAGE;
        return 0;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) return report(cfg.error());

    log::set_level(cfg.value().log_level);
    if (cfg.value().color_set && !cfg.value().color) {
        log::set_color_enabled(false);
    }
    log::debug("effective config: level=%s count=%d format=%s",
               log::level_name(cfg.value().log_level), cfg.value().count,
               format_name(cfg.value().format));

    const std::string& cmd = args.value().command;
    if (cmd == "generate") return cmd_generate(args.value(), cfg.value());
    if (cmd == "inspect") return cmd_inspect(args.value());
    if (cmd == "canonicalize") return cmd_canonicalize(args.value());
    if (cmd == "validate") return cmd_validate(args.value());

    std::cerr << "error: unknown command '" << cmd << "'\n" << USAGE;
    return EXIT_USAGE;
}
