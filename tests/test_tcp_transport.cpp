#include <catch2/catch_test_macros.hpp>

#include "platform/linux/tcp_frame_client.hpp"
#include "platform/linux/tcp_frame_server.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

// Server sockets are non-blocking, so poll briefly for frames to arrive.
std::vector<protocol::Frame> read_some(TcpFrameServer& server, int fd, size_t want) {
    std::vector<protocol::Frame> frames;
    for (int i = 0; i < 200 && frames.size() < want; ++i) {
        server.read_frames(fd, frames);
        if (frames.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return frames;
}

int accept_one(TcpFrameServer& server) {
    for (int i = 0; i < 200; ++i) {
        int fd = server.accept_client();
        if (fd >= 0) return fd;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return -1;
}

} // namespace

TEST_CASE("Endpoint parsing", "[transport]") {

    SECTION("HostPort") {
        auto ep = parse_endpoint("127.0.0.1:8081");
        REQUIRE(ep.has_value());
        REQUIRE(ep->host == "127.0.0.1");
        REQUIRE(ep->port == 8081);
    }

    SECTION("Schemes") {
        auto tcp = parse_endpoint("tcp://asr.lan:9000");
        REQUIRE(tcp.has_value());
        REQUIRE(tcp->host == "asr.lan");

        auto slash = parse_endpoint("tcp://localhost:8081/");
        REQUIRE(slash.has_value());
        REQUIRE(slash->host == "localhost");
        REQUIRE(slash->port == 8081);
    }

    SECTION("WebSocketSchemesRejected") {
        auto ws = parse_endpoint("ws://localhost:8081/");
        REQUIRE_FALSE(ws.has_value());
        REQUIRE(ws.error().find("ws") != std::string::npos);
        REQUIRE_FALSE(parse_endpoint("wss://asr.lan:443").has_value());
        REQUIRE_FALSE(parse_endpoint("http://asr.lan:8081").has_value());
    }

    SECTION("Ipv6") {
        auto ep = parse_endpoint("[::1]:8081");
        REQUIRE(ep.has_value());
        REQUIRE(ep->host == "::1");
        REQUIRE(ep->port == 8081);
    }

    SECTION("Invalid") {
        REQUIRE_FALSE(parse_endpoint("localhost").has_value());
        REQUIRE_FALSE(parse_endpoint("localhost:").has_value());
        REQUIRE_FALSE(parse_endpoint("localhost:0").has_value());
        REQUIRE_FALSE(parse_endpoint("localhost:70000").has_value());
        REQUIRE_FALSE(parse_endpoint("localhost:80x").has_value());
        REQUIRE_FALSE(parse_endpoint(":8081").has_value());
        REQUIRE_FALSE(parse_endpoint("[::1]8081").has_value());
    }
}

TEST_CASE("TCP frame transport", "[transport]") {
    TcpFrameServer server;
    REQUIRE(server.start("127.0.0.1", 0));
    REQUIRE(server.port() != 0);

    SECTION("ClientConnects") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        REQUIRE(client.is_connected());

        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);
        REQUIRE(server.client_count() == 1);

        server.close_client(client_fd);
        REQUIRE(server.client_count() == 0);
        client.close();
        REQUIRE_FALSE(client.is_connected());
    }

    SECTION("ConnectRefused") {
        uint16_t port = server.port();
        server.stop();
        TcpFrameClient client;
        REQUIRE_FALSE(client.connect("127.0.0.1", port));
    }

    SECTION("RoundTrip") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send_frame(protocol::FrameType::Text, protocol::encode_config(16000)));
        REQUIRE(client.send_frame(protocol::FrameType::Binary, std::string(3200, '\x01')));

        auto frames = read_some(server, client_fd, 2);
        REQUIRE(frames.size() == 2);
        REQUIRE(frames[0].type == protocol::FrameType::Text);
        REQUIRE(frames[0].payload == protocol::encode_config(16000));
        REQUIRE(frames[1].type == protocol::FrameType::Binary);
        REQUIRE(frames[1].payload.size() == 3200);

        REQUIRE(server.send_frame(client_fd, protocol::FrameType::Text, R"({"text":"hi"})"));
        auto reply = client.recv_frame(1000);
        REQUIRE(reply.has_value());
        REQUIRE(reply->has_value());
        REQUIRE((*reply)->payload == R"({"text":"hi"})");
    }

    SECTION("LargeBinaryFrame") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        std::string big(256 * 1024, '\x7f');
        std::jthread sender([&client, &big] { client.send_frame(protocol::FrameType::Binary, big); });

        auto frames = read_some(server, client_fd, 1);
        sender.join();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].payload == big);
    }

    SECTION("SlowReaderBacklogIsBounded") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        // The client never reads; sends must not block and must eventually refuse.
        std::string chunk(1024 * 1024, 'x');
        bool refused = false;
        for (int i = 0; i < 64 && !refused; i++) {
            refused = !server.send_frame(client_fd, protocol::FrameType::Binary, chunk);
        }
        REQUIRE(refused);
        REQUIRE(server.has_pending_output(client_fd));
    }

    SECTION("PendingOutputDrainsOnFlush") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        std::string big(3 * 1024 * 1024, 'y');
        REQUIRE(server.send_frame(client_fd, protocol::FrameType::Binary, big));

        std::atomic<size_t> received{0};
        std::jthread reader([&client, &received] {
            auto r = client.recv_frame(3000);
            if (r && r->has_value()) received = (*r)->payload.size();
        });
        for (int i = 0; i < 3000 && server.has_pending_output(client_fd); i++) {
            REQUIRE(server.flush(client_fd));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        reader.join();
        REQUIRE_FALSE(server.has_pending_output(client_fd));
        REQUIRE(received == big.size());
    }

    SECTION("RecvTimesOut") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        REQUIRE(accept_one(server) >= 0);

        auto r = client.recv_frame(20);
        REQUIRE(r.has_value());
        REQUIRE_FALSE(r->has_value());
    }

    SECTION("ClientDisconnect") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send_frame(protocol::FrameType::Text, protocol::encode_eof()));
        client.close();

        // Frames sent before the close are still delivered.
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<protocol::Frame> frames;
        REQUIRE_FALSE(server.read_frames(client_fd, frames));
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].payload == protocol::encode_eof());

        server.close_client(client_fd);
    }

    SECTION("ServerDisconnect") {
        TcpFrameClient client;
        REQUIRE(client.connect("127.0.0.1", server.port()));
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        auto r = client.recv_frame(1000);
        REQUIRE_FALSE(r.has_value());
    }

    SECTION("GarbageBreaksFraming") {
        int raw = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(server.port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        int client_fd = accept_one(server);
        REQUIRE(client_fd >= 0);

        // A valid frame followed by a header with a bad magic.
        std::string bytes = protocol::encode_frame(protocol::FrameType::Text, protocol::encode_eof());
        std::string bad = protocol::encode_frame(protocol::FrameType::Text, "{}");
        bad[0] = 'X';
        bytes += bad;
        REQUIRE(::send(raw, bytes.data(), bytes.size(), 0) == static_cast<ssize_t>(bytes.size()));

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<protocol::Frame> frames;
        REQUIRE_FALSE(server.read_frames(client_fd, frames));
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].payload == protocol::encode_eof());

        server.close_client(client_fd);
        ::close(raw);
    }
}
