//! # SuperFastGen Entry Point
//!
//! Delegates to `cli::sfg_main()`, which parses arguments, initializes
//! logging and runs the selected command.

#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    return sfg::cli::sfg_main(argc, argv);
}
