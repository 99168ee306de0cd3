#include "platform/linux/tcp_frame_client.hpp"

#include "logging.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

std::expected<Endpoint, std::string> parse_endpoint(std::string_view address) {
    if (auto sep = address.find("://"); sep != std::string_view::npos) {
        auto scheme = address.substr(0, sep);
        if (scheme != "tcp") {
            return std::unexpected("unsupported scheme \"" + std::string(scheme) +
                                   "\": the server speaks framed TCP, use tcp://host:port");
        }
        address.remove_prefix(sep + 3);
    }
    if (address.ends_with('/')) address.remove_suffix(1);

    Endpoint ep;
    std::string_view port_part;

    if (address.starts_with('[')) {
        auto close = address.find(']');
        if (close == std::string_view::npos || close + 1 >= address.size() ||
            address[close + 1] != ':') {
            return std::unexpected("invalid address: " + std::string(address));
        }
        ep.host = std::string(address.substr(1, close - 1));
        port_part = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return std::unexpected("missing port in address: " + std::string(address));
        }
        ep.host = std::string(address.substr(0, colon));
        port_part = address.substr(colon + 1);
    }

    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
    if (ec != std::errc{} || ptr != port_part.data() + port_part.size() || port == 0 || port > 65535) {
        return std::unexpected("invalid port: " + std::string(port_part));
    }
    if (ep.host.empty()) {
        return std::unexpected("missing host in address: " + std::string(address));
    }
    ep.port = static_cast<uint16_t>(port);
    return ep;
}

TcpFrameClient::TcpFrameClient() = default;

TcpFrameClient::~TcpFrameClient() {
    close();
}

bool TcpFrameClient::connect(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        logging::error("client: cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }

    for (auto* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            logging::debug("client: connect failed: {}", std::strerror(errno));
            ::close(fd);
            continue;
        }

        // Audio frames are small and latency matters more than packing.
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    decoder_ = {};
    return fd_ >= 0;
}

bool TcpFrameClient::send_frame(protocol::FrameType type, std::string_view payload) {
    if (fd_ < 0) return false;

    auto msg = protocol::encode_frame(type, payload);
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::expected<std::optional<protocol::Frame>, std::string> TcpFrameClient::recv_frame(int timeout_ms) {
    if (fd_ < 0) return std::unexpected("not connected");

    while (true) {
        auto frame = decoder_.next();
        if (!frame) return std::unexpected(frame.error());
        if (frame->has_value()) return frame;

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return std::unexpected(std::string("poll failed: ") + std::strerror(errno));
        if (ret == 0) return std::nullopt;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) return std::unexpected("connection closed by server");
        if (n < 0) return std::unexpected(std::string("recv failed: ") + std::strerror(errno));

        decoder_.feed(tmp, static_cast<size_t>(n));
    }
}

void TcpFrameClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
