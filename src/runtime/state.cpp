#include "runtime/state.h"

namespace modelcat {

std::atomic<bool> g_running_flag{true};
std::atomic<bool> g_ready_flag{false};

}  // namespace modelcat
