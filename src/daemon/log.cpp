#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace logging {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_write_mutex;

void write_line(std::string_view prefix, std::string_view sep, std::string_view msg) {
    std::lock_guard lock(g_write_mutex);
    std::fwrite(prefix.data(), 1, prefix.size(), stderr);
    std::fwrite(sep.data(), 1, sep.size(), stderr);
    std::fwrite(msg.data(), 1, msg.size(), stderr);
    std::fputc('\n', stderr);
}

} // namespace

void set_verbose(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void error(std::string_view component, std::string_view msg) {
    write_line(component, ": ", msg);
}

void info(std::string_view msg) {
    if (!verbose()) return;
    write_line("[localscribe]", " ", msg);
}

std::string fixed(double value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

} // namespace logging
