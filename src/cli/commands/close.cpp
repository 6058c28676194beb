// close command: ask a running service to close all model stores

#include "cli/cli_client.h"
#include "cli/commands.h"

#include <iostream>

namespace modelcat {
namespace cli {
namespace commands {

int close(const RemoteOptions& options) {
    CliClient client(options.host, options.port);

    if (!client.isServerRunning()) {
        std::cerr << "Error: Could not connect to modelcat service at "
                  << client.getHost() << ":" << client.getPort() << std::endl;
        return 2;
    }

    auto result = client.closeCatalog();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return result.error == CliError::ConnectionError ? 2 : 1;
    }

    std::cout << "Closed all models of " << result.data->value("model_dir", std::string()) << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelcat
