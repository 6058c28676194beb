#include "utils/cli.h"
#include "utils/version.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace modelcat {

namespace {

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "modelcat serve - Start the catalog service\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelcat serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>          Server port (default: 4040, or MODELCAT_PORT)\n";
    oss << "    --host <HOST>          Bind address (default: 0.0.0.0)\n";
    oss << "    --models-dir <DIR>     Model store directory\n";
    oss << "    --log-dir <DIR>        Default model run log directory\n";
    oss << "    -h, --help             Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    MODELCAT_PORT                 HTTP server port (default: 4040)\n";
    oss << "    MODELCAT_BIND_ADDRESS         Bind address\n";
    oss << "    MODELCAT_MODELS_DIR           Model store directory\n";
    oss << "    MODELCAT_MODELS_LOG_DIR       Model run log directory\n";
    oss << "    MODELCAT_CONFIG               Config file path (default: ~/.modelcat/config.json)\n";
    oss << "    MODELCAT_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    MODELCAT_LOG_DIR              Log directory (default: ~/.modelcat/logs)\n";
    oss << "    MODELCAT_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    return oss.str();
}

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "modelcat list - Scan the model directory and list models\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelcat list [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --models-dir <DIR>     Model store directory (default: from config)\n";
    oss << "    --log-dir <DIR>        Model run log directory\n";
    oss << "    --json                 Print JSON instead of a table\n";
    oss << "    -h, --help             Print help\n";
    return oss.str();
}

std::string getRemoteHelpMessage(const char* command, const char* summary) {
    std::ostringstream oss;
    oss << "modelcat " << command << " - " << summary << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelcat " << command << " [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --host <HOST>          Service host (default: MODELCAT_HOST or 127.0.0.1)\n";
    oss << "    --port <PORT>          Service port (default: MODELCAT_PORT or 4040)\n";
    oss << "    -h, --help             Print help\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

uint16_t parsePort(const char* text) {
    int v = std::stoi(text);
    if (v <= 0 || v > 65535) throw std::out_of_range("port out of range");
    return static_cast<uint16_t>(v);
}

CliResult errorResult(CliResult result, const std::string& message) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + getHelpMessage();
    return result;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "modelcat " << MODELCAT_VERSION << " - simulation model catalog service\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelcat <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the service (foreground)\n";
    oss << "    list       Scan the model directory and list models\n";
    oss << "    refresh    Ask a running service to rescan its model directory\n";
    oss << "    close      Ask a running service to close all model stores\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'modelcat <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "modelcat " << MODELCAT_VERSION << "\n";
    return oss.str();
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None:
            return "none";
        case Subcommand::Serve:
            return "serve";
        case Subcommand::List:
            return "list";
        case Subcommand::Refresh:
            return "refresh";
        case Subcommand::Close:
            return "close";
    }
    return "unknown";
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - server mode
    if (argc < 2) {
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    try {
        if (std::strcmp(command, "serve") == 0) {
            result.subcommand = Subcommand::Serve;
            if (hasHelpFlag(argc, argv, 2)) {
                result.should_exit = true;
                result.output = getServeHelpMessage();
                return result;
            }
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                    result.serve_options.port = parsePort(argv[++i]);
                } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                    result.serve_options.host = argv[++i];
                } else if (std::strcmp(argv[i], "--models-dir") == 0 && i + 1 < argc) {
                    result.serve_options.models_dir = argv[++i];
                } else if (std::strcmp(argv[i], "--log-dir") == 0 && i + 1 < argc) {
                    result.serve_options.log_dir = argv[++i];
                } else {
                    return errorResult(result, std::string("unknown serve option: ") + argv[i]);
                }
            }
            return result;
        }

        if (std::strcmp(command, "list") == 0) {
            result.subcommand = Subcommand::List;
            if (hasHelpFlag(argc, argv, 2)) {
                result.should_exit = true;
                result.output = getListHelpMessage();
                return result;
            }
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--models-dir") == 0 && i + 1 < argc) {
                    result.list_options.models_dir = argv[++i];
                } else if (std::strcmp(argv[i], "--log-dir") == 0 && i + 1 < argc) {
                    result.list_options.log_dir = argv[++i];
                } else if (std::strcmp(argv[i], "--json") == 0) {
                    result.list_options.json = true;
                } else {
                    return errorResult(result, std::string("unknown list option: ") + argv[i]);
                }
            }
            return result;
        }

        if (std::strcmp(command, "refresh") == 0 || std::strcmp(command, "close") == 0) {
            const bool is_refresh = std::strcmp(command, "refresh") == 0;
            result.subcommand = is_refresh ? Subcommand::Refresh : Subcommand::Close;
            if (hasHelpFlag(argc, argv, 2)) {
                result.should_exit = true;
                result.output = is_refresh
                                    ? getRemoteHelpMessage("refresh", "Rescan the model directory of a running service")
                                    : getRemoteHelpMessage("close", "Close all model stores of a running service");
                return result;
            }
            for (int i = 2; i < argc; ++i) {
                if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                    result.remote_options.host = argv[++i];
                } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                    result.remote_options.port = parsePort(argv[++i]);
                } else {
                    return errorResult(result, std::string("unknown option: ") + argv[i]);
                }
            }
            return result;
        }
    } catch (const std::exception&) {
        return errorResult(result, "invalid port number");
    }

    return errorResult(result, std::string("unknown command: ") + command);
}

}  // namespace modelcat
