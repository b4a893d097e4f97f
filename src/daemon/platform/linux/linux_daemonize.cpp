#include "platform/daemonizer.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        logging::error("daemon", std::string("fork() failed: ") + std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) _exit(1);

    // Fork again so the daemon can never reacquire a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Audit database and socket stay private to the user.
    ::umask(077);

    if (!std::freopen("/dev/null", "r", stdin) ||
        !std::freopen("/dev/null", "w", stdout) ||
        !std::freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
