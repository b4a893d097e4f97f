#pragma once

namespace platform {

// Detach from the controlling terminal. Exits the parent processes.
void daemonize();

} // namespace platform
