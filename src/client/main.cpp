#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "Commands:\n"
              << "  start                          Start a dictation session\n"
              << "  stop                           Stop the session\n"
              << "  status                         Show daemon status\n"
              << "  backends                       List transcription backends\n"
              << "  select <id>                    Switch the active backend\n"
              << "  devices                        List input devices\n"
              << "  select-device [<name>]         Use an input device from the next start\n"
              << "                                 (no name: follow the system default)\n"
              << "  privacy                        Show privacy mode and allow-list\n"
              << "  consent-enable [--category C] [--destination URL]\n"
              << "                                 Begin cloud opt-in\n"
              << "  consent-credential             Read an API key from stdin\n"
              << "  consent-confirm <destination>  Confirm the cloud destination\n"
              << "  consent-revoke                 Return to local-only mode\n"
              << "  audit [--limit N]              Show recent egress decisions\n"
              << "  watch                          Print transcripts and events\n";
}

static void print_event(const json& ev) {
    auto kind = ev.value("event", "");
    if (kind == "transcript") {
        std::cout << ev.value("text", "") << std::endl;
    } else if (kind == "transcript_error" || kind == "segment_rejected") {
        std::cerr << "[" << kind << "] segment " << ev.value("segment", 0) << ": "
                  << ev.value("code", "") << ": " << ev.value("message", "") << std::endl;
    } else if (kind == "capture") {
        std::cerr << "[capture] " << ev.value("kind", "") << " " << ev.value("from", "")
                  << " -> " << ev.value("to", "");
        if (ev.contains("reason")) std::cerr << " (" << ev["reason"].get<std::string>() << ")";
        std::cerr << std::endl;
    } else if (kind == "egress") {
        std::cerr << "[egress] " << (ev.value("allowed", false) ? "allowed " : "denied ")
                  << ev.value("category", "") << " -> " << ev.value("destination", "")
                  << " (" << ev.value("reason", "") << ")" << std::endl;
    } else {
        std::cerr << ev.dump() << std::endl;
    }
}

static int watch(UnixSocketClient& client) {
    json ev;
    while (client.recv(ev, -1)) {
        print_event(ev);
    }
    std::cerr << "Connection to daemon closed" << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string category = "transcription";
    std::string destination;
    int limit = 20;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--category" && i + 1 < argc) {
            category = argv[++i];
        } else if (arg == "--destination" && i + 1 < argc) {
            destination = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    json cmd;
    if (command == "start" || command == "stop" || command == "status" ||
        command == "backends" || command == "privacy" || command == "devices") {
        cmd = {{"cmd", command}};
    } else if (command == "select") {
        if (positional.empty()) {
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "select_backend"}, {"id", positional[0]}};
    } else if (command == "select-device") {
        cmd = {{"cmd", "select_device"}, {"name", positional.empty() ? "" : positional[0]}};
    } else if (command == "consent-enable") {
        cmd = {{"cmd", "consent_enable"}, {"category", category}};
        if (!destination.empty()) cmd["destination"] = destination;
    } else if (command == "consent-credential") {
        // Never on the command line, where it would land in shell history.
        std::string credential;
        std::getline(std::cin, credential);
        cmd = {{"cmd", "consent_credential"}, {"credential", credential}};
    } else if (command == "consent-confirm") {
        if (positional.empty()) {
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "consent_confirm"}, {"destination", positional[0]}};
    } else if (command == "consent-revoke") {
        cmd = {{"cmd", "consent_revoke"}};
    } else if (command == "audit") {
        cmd = {{"cmd", "audit"}, {"limit", limit}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::cerr << "Failed to connect to daemon at " << sock_path << "\n"
                  << "Is localscribe running?\n";
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::cerr << "No response from daemon (timeout)\n";
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::cerr << "Error (" << response.value("code", "unknown") << "): "
                  << response.value("message", "unknown error") << "\n";
        return 1;
    }

    if (command == "watch") {
        return watch(client);
    }

    if (command == "status") {
        std::cout << "State: " << response.value("state", "unknown") << "\n";
        if (response.contains("device")) {
            std::cout << "Device: " << response["device"].value("description", "") << "\n";
        }
        std::cout << "Backend: " << response.value("backend", "") << "\n"
                  << "Privacy: " << response.value("privacy", "") << "\n"
                  << "In flight: " << response.value("in_flight", 0) << "\n";
        if (response.contains("buffer")) {
            auto& b = response["buffer"];
            std::cout << "Buffer: " << b.value("used", 0) << "/" << b.value("capacity", 0)
                      << " samples, " << b.value("dropped", 0) << " dropped\n";
        }
    } else if (command == "backends") {
        for (auto& b : response["backends"]) {
            std::cout << (b.value("active", false) ? "* " : "  ") << b.value("id", "")
                      << (b.value("available", false) ? "" : " (unavailable)")
                      << (b.value("requires_network", false) ? " [network]" : "") << "\n";
        }
    } else if (command == "devices") {
        auto selected = response.value("selected", "");
        for (auto& d : response["devices"]) {
            auto name = d.value("name", "");
            std::cout << (name == selected ? "* " : "  ") << name << "  "
                      << d.value("description", "")
                      << (d.value("default", false) ? " (default)" : "") << "\n";
        }
    } else if (command == "select-device") {
        auto name = response.value("device", "");
        std::cout << "Input device: " << (name.empty() ? "system default" : name)
                  << " (from the next start)\n";
    } else if (command == "audit") {
        for (auto& e : response["entries"]) {
            std::cout << "[" << e.value("timestamp", "") << "] "
                      << (e.value("allowed", false) ? "ALLOW " : "DENY  ")
                      << e.value("category", "") << " " << e.value("destination", "")
                      << " " << e.value("bytes", 0) << "B " << e.value("reason", "") << "\n";
        }
    } else {
        std::cout << response.dump(2) << "\n";
    }

    return 0;
}
