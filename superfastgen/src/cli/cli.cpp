//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to a command handler. Logging flags
//! are accepted anywhere and skipped here.
//!
//! ## Options
//!
//! | Option | Commands | Effect |
//! |--------|----------|--------|
//! | `--type=<freezed\|json\|riverpod\|provider\|all>` | generate, watch | variants to run (repeatable) |
//! | `--input=<path>` | all but help | source root or file (repeatable) |
//! | `--output=<dir>` | generate, all, watch, clean | mirrored output root |
//! | `--delete-conflicting-outputs` | generate, all, watch | clean companions before the run |
//! | `--config=<file>` | all | configuration file (must exist) |
//! | `--report=<file>` | generate, all, clean, watch | write the run report as JSON |

#include "cli/cli.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <iostream>

namespace sfg::cli {

namespace {

auto command_from(std::string_view name) -> std::optional<Command> {
    if (name == "--help" || name == "-h" || name == "help") {
        return Command::Help;
    }
    if (name == "--version" || name == "-V") {
        return Command::Version;
    }
    if (name == "generate") {
        return Command::Generate;
    }
    if (name == "all") {
        return Command::All;
    }
    if (name == "clean") {
        return Command::Clean;
    }
    if (name == "watch") {
        return Command::Watch;
    }
    if (name == "assets") {
        return Command::Assets;
    }
    return std::nullopt;
}

/// Splits `--name=value`, or takes the value from the next argument.
/// Returns nullopt when `arg` is not `--name`.
auto option_value(std::string_view name, const std::vector<std::string>& args, size_t& i)
    -> std::optional<Result<std::string, UsageError>> {
    std::string_view arg = args[i];
    if (!arg.starts_with(name)) {
        return std::nullopt;
    }
    auto rest = arg.substr(name.size());
    if (rest.starts_with("=")) {
        return Result<std::string, UsageError>{std::string(rest.substr(1))};
    }
    if (!rest.empty()) {
        return std::nullopt;
    }
    if (i + 1 >= args.size()) {
        return Result<std::string, UsageError>{
            UsageError{.message = "missing value for " + std::string(name)}};
    }
    ++i;
    return Result<std::string, UsageError>{args[i]};
}

void add_variants(CliOptions& options, const std::vector<model::VariantTag>& tags) {
    auto& variants = options.overrides.variants;
    if (!variants) {
        variants.emplace();
    }
    for (auto tag : tags) {
        if (std::find(variants->begin(), variants->end(), tag) == variants->end()) {
            variants->push_back(tag);
        }
    }
}

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

auto parse_args(const std::vector<std::string>& args) -> Result<CliOptions, UsageError> {
    CliOptions options;
    bool have_command = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (log::is_log_option(arg)) {
            continue;
        }

        if (!have_command) {
            auto command = command_from(arg);
            if (!command) {
                return UsageError{.message = "unknown command '" + arg + "'"};
            }
            options.command = *command;
            have_command = true;
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            continue;
        }
        if (arg == "--delete-conflicting-outputs") {
            options.overrides.delete_conflicting_outputs = true;
            continue;
        }

        if (auto value = option_value("--type", args, i)) {
            if (is_err(*value)) {
                return unwrap_err(*value);
            }
            auto tags = config::parse_variant_selection(unwrap(*value));
            if (!tags) {
                return UsageError{.message = "unknown generator type '" + unwrap(*value) +
                                             "' (expected freezed, json, riverpod, provider or all)"};
            }
            add_variants(options, *tags);
            continue;
        }
        if (auto value = option_value("--input", args, i)) {
            if (is_err(*value)) {
                return unwrap_err(*value);
            }
            auto& inputs = options.overrides.input_paths;
            if (!inputs) {
                inputs.emplace();
            }
            inputs->emplace_back(unwrap(*value));
            continue;
        }
        if (auto value = option_value("--output", args, i)) {
            if (is_err(*value)) {
                return unwrap_err(*value);
            }
            options.overrides.output_root = fs::path(unwrap(*value));
            continue;
        }
        if (auto value = option_value("--config", args, i)) {
            if (is_err(*value)) {
                return unwrap_err(*value);
            }
            options.config_path = fs::path(unwrap(*value));
            continue;
        }
        if (auto value = option_value("--report", args, i)) {
            if (is_err(*value)) {
                return unwrap_err(*value);
            }
            options.report_path = fs::path(unwrap(*value));
            continue;
        }

        return UsageError{.message = "unknown option '" + arg + "'"};
    }

    if (options.command == Command::All) {
        add_variants(options, {model::VariantTag::Immutable, model::VariantTag::JsonCodec,
                               model::VariantTag::Provider});
    }
    return options;
}

// ============================================================================
// Help Text
// ============================================================================

void print_usage(std::ostream& out) {
    out << "SuperFastGen " << VERSION << " - Dart companion code generator\n\n"
        << "Usage: superfastgen <command> [options]\n\n"
        << "Commands:\n"
        << "  generate     Generate companions for the selected variants\n"
        << "  all          Generate every variant\n"
        << "  clean        Remove *.g.dart, *.freezed.dart and *.config.dart files\n"
        << "  watch        Generate, then regenerate on every change\n\n"
        << "Options:\n"
        << "  --type=<t>                    freezed, json, riverpod, provider or all\n"
        << "  --input=<path>                Source directory or file (default: lib)\n"
        << "  --output=<dir>                Write companions under <dir>\n"
        << "  --delete-conflicting-outputs  Remove existing companions first\n"
        << "  --config=<file>               Configuration file (default: superfastgen.yaml)\n"
        << "  --report=<file>               Write the run report as JSON\n\n"
        << "Logging:\n"
        << "  -q, --quiet                   Errors only\n"
        << "  -v, -vv, -vvv, --verbose      Info, debug, trace\n"
        << "  --log-level=<level>           trace, debug, info, warn, error, off\n"
        << "  --log-filter=<spec>           e.g. emit=trace,*=warn\n"
        << "  --log-file=<path>             Also append to <path>\n"
        << "  --log-format=<text|json>\n";
}

void print_version(std::ostream& out) {
    out << "superfastgen " << VERSION << "\n";
}

// ============================================================================
// Entry Point
// ============================================================================

int sfg_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_args(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed).message << "\n\n";
        print_usage(std::cerr);
        return 1;
    }
    const auto& options = unwrap(parsed);

    switch (options.command) {
    case Command::Help:
        print_usage(std::cout);
        return 0;
    case Command::Version:
        print_version(std::cout);
        return 0;
    case Command::Generate:
    case Command::All:
        return run_generate(options);
    case Command::Clean:
        return run_clean(options);
    case Command::Watch:
        return run_watch(options);
    case Command::Assets:
        SFG_LOG_WARN("cli", "The assets generator is not supported");
        std::cerr << "superfastgen: 'assets' is not supported by this generator\n";
        return 0;
    }
    return 1;
}

} // namespace sfg::cli
