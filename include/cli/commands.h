#pragma once

#include "utils/cli.h"

namespace modelcat {
namespace cli {
namespace commands {

// Note: 'serve' is implemented directly in main.cpp as it requires
// access to run_service() and the server infrastructure.

/// Execute the 'list' command: scan the model directory locally, no service needed
/// @return Exit code (0=success, 1=error)
int list(const ListOptions& options);

/// Execute the 'refresh' command against a running service
/// @return Exit code (0=success, 1=error, 2=connection error)
int refresh(const RemoteOptions& options);

/// Execute the 'close' command against a running service
/// @return Exit code (0=success, 1=error, 2=connection error)
int close(const RemoteOptions& options);

}  // namespace commands
}  // namespace cli
}  // namespace modelcat
