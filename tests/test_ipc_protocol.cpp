#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ls_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking; poll briefly until n commands arrive.
std::vector<json> read_n(UnixSocketServer& server, int fd, size_t n) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < n; ++i) {
        if (!server.read_commands(fd, cmds)) break;
        if (cmds.size() < n) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds;
}

int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("SocketOwnerOnly") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));
        auto cmds = read_n(server, client_fd, 1);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["state"] == "idle");

        server.close_client(client_fd);
        client.close();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();

        for (int i = 0; i < 5; ++i) REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));

        auto cmds = read_n(server, client_fd, 5);
        REQUIRE(cmds.size() == 5);
        for (int i = 0; i < 5; ++i) REQUIRE(cmds[i]["seq"] == i);

        // Several responses in one read are split by the client.
        for (int i = 0; i < 3; ++i) REQUIRE(server.send_response(client_fd, {{"seq", i}}));
        for (int i = 0; i < 3; ++i) {
            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }
    }

    SECTION("LargeResponseArrivesWhole") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();

        // Larger than the default socket buffer, so the server has to wait
        // for the reader partway through.
        std::string blob(1 << 20, 'x');
        json resp;
        bool received = false;
        std::thread reader([&] { received = client.recv(resp, 2000); });

        REQUIRE(server.send_response(client_fd, {{"blob", blob}}));
        reader.join();

        REQUIRE(received);
        REQUIRE(resp["blob"].get<std::string>().size() == blob.size());
    }

    SECTION("RequestHelper") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();

        std::thread responder([&] {
            auto cmds = read_n(server, client_fd, 1);
            if (!cmds.empty()) server.send_response(client_fd, {{"echo", cmds[0]["cmd"]}});
        });

        json resp;
        REQUIRE(client.request({{"cmd", "privacy"}}, resp, 2000));
        responder.join();
        REQUIRE(resp["echo"] == "privacy");
    }

    SECTION("InvalidLineDiscarded") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int fd = raw_connect(sock_path);
        int client_fd = server.accept_client();

        std::string data = "not json\n{\"cmd\":\"status\"}\n";
        REQUIRE(::send(fd, data.data(), data.size(), 0) == static_cast<ssize_t>(data.size()));

        auto cmds = read_n(server, client_fd, 2);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0].is_discarded());
        REQUIRE(cmds[1]["cmd"] == "status");
        ::close(fd);
    }

    SECTION("OversizedLineDisconnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int fd = raw_connect(sock_path);
        int client_fd = server.accept_client();

        std::thread writer([fd] {
            std::string junk(100 * 1024, 'x');
            ::send(fd, junk.data(), junk.size(), MSG_NOSIGNAL);
        });

        bool open = true;
        std::vector<json> cmds;
        for (int i = 0; i < 500 && open; ++i) {
            open = server.read_commands(client_fd, cmds);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE_FALSE(open);
        REQUIRE(cmds.empty());

        server.close_client(client_fd);
        ::close(fd);
        writer.join();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();

        REQUIRE(client.send({{"cmd", "stop"}}));
        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        // The command sent before the hangup is still delivered.
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "stop");

        server.close_client(client_fd);
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }
}
