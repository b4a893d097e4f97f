#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// $<xdg_var>/localscribe, else $HOME/<home_fallback>/localscribe.
std::string xdg_app_dir(const char* xdg_var, const char* home_fallback) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/localscribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/localscribe";
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/localscribe.sock";
    return "/tmp/localscribe.sock";
}

} // namespace platform
