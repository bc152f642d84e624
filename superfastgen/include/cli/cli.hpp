//! # Command-Line Interface
//!
//! ```text
//! sfg_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ generate       → run_generate()
//!   ├─ all            → run_generate() with every variant
//!   ├─ clean          → run_clean()
//!   ├─ watch          → run_watch()
//!   └─ assets         → reported as unsupported
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Success, including runs whose files reported errors |
//! | 1 | Bad usage, unreadable configuration, or watch unavailable |

#ifndef SFG_CLI_CLI_HPP
#define SFG_CLI_CLI_HPP

#include "common.hpp"
#include "config/config.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sfg::cli {

namespace fs = std::filesystem;

enum class Command { Help, Version, Generate, All, Clean, Watch, Assets };

struct CliOptions {
    Command command = Command::Help;
    config::ConfigOverrides overrides;
    std::optional<fs::path> config_path;
    std::optional<fs::path> report_path;
};

struct UsageError {
    std::string message;
};

/// Parses everything after the program name. Logging options are skipped;
/// `log::parse_log_options` consumes them separately.
[[nodiscard]] auto parse_args(const std::vector<std::string>& args) -> Result<CliOptions, UsageError>;

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

// Command handlers; each returns the process exit code.
[[nodiscard]] auto run_generate(const CliOptions& options) -> int;
[[nodiscard]] auto run_clean(const CliOptions& options) -> int;
[[nodiscard]] auto run_watch(const CliOptions& options) -> int;

/// Main entry point.
int sfg_main(int argc, char* argv[]);

} // namespace sfg::cli

#endif // SFG_CLI_CLI_HPP
