// refresh command: ask a running service to rescan its model directory

#include "cli/cli_client.h"
#include "cli/commands.h"

#include <iostream>

namespace modelcat {
namespace cli {
namespace commands {

int refresh(const RemoteOptions& options) {
    CliClient client(options.host, options.port);

    if (!client.isServerRunning()) {
        std::cerr << "Error: Could not connect to modelcat service at "
                  << client.getHost() << ":" << client.getPort() << std::endl;
        std::cerr << "Start the service with: modelcat serve" << std::endl;
        return 2;
    }

    auto result = client.refreshCatalog();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return result.error == CliError::ConnectionError ? 2 : 1;
    }

    const auto count = result.data->value("model_count", 0);
    std::cout << "Refreshed " << result.data->value("model_dir", std::string()) << ": "
              << count << " model(s)" << std::endl;
    if (result.data->contains("warning")) {
        std::cerr << "Warning: " << (*result.data)["warning"].get<std::string>() << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelcat
