#include "config.hpp"
#include "log.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <string>

static void usage() {
    std::fputs("Usage: localscribe [options]\n"
               "Options:\n"
               "  -f, --foreground    Run in foreground (don't daemonize)\n"
               "  -v, --verbose       Enable verbose logging\n"
               "  -c, --config PATH   Config file path\n"
               "  -h, --help          Show this help\n",
               stdout);
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                logging::error("localscribe", "--config needs a path");
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            logging::error("localscribe", "unknown option " + arg);
            usage();
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (config_path.empty() && !platform::config_dir().empty()) {
        // Re-read at each session start, so a file created later still applies.
        config_path = platform::config_dir() + "/config.json";
    }
    logging::set_verbose(verbose || config.verbose);

    if (!foreground) {
        platform::daemonize();
    }

    logging::info("Starting (backend: " + config.backend.default_id + ", language: " +
                  config.backend.language + ")");

    LinuxEventLoop loop(std::move(config), config_path);
    if (!loop.init()) {
        logging::error("localscribe", "failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
