#pragma once

#include <string>
#include <string_view>

// Minimal stderr logging shared by the daemon.
// Errors and warnings are always printed with a component prefix
// ("audio: ...", "db: ..."). Verbose lines are printed only when enabled.
namespace logging {

void set_verbose(bool enabled);
bool verbose();

// "<component>: <msg>", always printed.
void error(std::string_view component, std::string_view msg);

// "[localscribe] <msg>", printed when verbose.
void info(std::string_view msg);

// Fixed-point formatting helper for log lines and IPC text ("2.5").
std::string fixed(double value, int precision = 1);

} // namespace logging
