#pragma once

#include <cstdint>
#include <string>

namespace modelcat {

/// Subcommand types for modelcat CLI
enum class Subcommand {
    None,      // No subcommand (server mode)
    Serve,     // serve
    List,      // list
    Refresh,   // refresh
    Close,     // close
};

/// Options for serve command (empty / 0 = use config)
struct ServeOptions {
    uint16_t port{0};
    std::string host;
    std::string models_dir;
    std::string log_dir;
};

/// Options for list command
struct ListOptions {
    std::string models_dir;
    std::string log_dir;
    bool json{false};
};

/// Options for commands talking to a running service (refresh, close)
struct RemoteOptions {
    std::string host;
    uint16_t port{0};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    ServeOptions serve_options;
    ListOptions list_options;
    RemoteOptions remote_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace modelcat
