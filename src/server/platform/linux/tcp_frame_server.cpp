#include "platform/linux/tcp_frame_server.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int MAX_READS_PER_EVENT = 16;

} // namespace

TcpFrameServer::TcpFrameServer() = default;

TcpFrameServer::~TcpFrameServer() {
    stop();
}

bool TcpFrameServer::start(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        logging::error("server: cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }

    for (auto* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          ai->ai_protocol);
        if (fd < 0) continue;

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            logging::error("server: bind() failed: {}", std::strerror(errno));
            ::close(fd);
            continue;
        }
        if (::listen(fd, SOMAXCONN) < 0) {
            logging::error("server: listen() failed: {}", std::strerror(errno));
            ::close(fd);
            continue;
        }

        server_fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (server_fd_ < 0) return false;

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        if (addr.ss_family == AF_INET) {
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
        } else if (addr.ss_family == AF_INET6) {
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
        }
    }
    return true;
}

void TcpFrameServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    port_ = 0;
}

int TcpFrameServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}, {}});
    return fd;
}

bool TcpFrameServer::read_frames(int client_fd, std::vector<protocol::Frame>& frames) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    bool alive = true;
    char buf[16384];
    for (int i = 0; i < MAX_READS_PER_EVENT; i++) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client->decoder.feed(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        if (n < 0) {
            logging::info("server: recv on fd {} failed: {}", client_fd, std::strerror(errno));
        }
        alive = false;
        break;
    }

    while (true) {
        auto frame = client->decoder.next();
        if (!frame) {
            logging::error("server: framing error on fd {}: {}", client_fd, frame.error());
            return false;
        }
        if (!frame->has_value()) break;
        frames.push_back(std::move(**frame));
    }

    return alive;
}

bool TcpFrameServer::send_frame(int client_fd, protocol::FrameType type, std::string_view payload) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    auto frame = protocol::encode_frame(type, payload);
    if (client->outbound.size() + frame.size() > MAX_OUTBOUND_BYTES) {
        logging::warn("server: fd {} has {} bytes unsent, refusing {} more",
                      client_fd, client->outbound.size(), frame.size());
        return false;
    }
    client->outbound += frame;
    return flush(client_fd);
}

bool TcpFrameServer::flush(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    auto& out = client->outbound;
    size_t sent = 0;
    bool ok = true;
    while (sent < out.size()) {
        ssize_t n = ::send(client_fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        logging::info("server: send on fd {} failed: {}", client_fd, std::strerror(errno));
        ok = false;
        break;
    }
    out.erase(0, sent);
    return ok;
}

bool TcpFrameServer::has_pending_output(int client_fd) const {
    auto it = std::ranges::find_if(clients_, [client_fd](const ClientBuffer& c) {
        return c.fd == client_fd;
    });
    return it != clients_.end() && !it->outbound.empty();
}

void TcpFrameServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

TcpFrameServer::ClientBuffer* TcpFrameServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
