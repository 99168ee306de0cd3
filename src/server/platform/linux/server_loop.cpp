#include "platform/linux/server_loop.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <utility>
#include <vector>

ServerLoop::ServerLoop(Config config, std::unique_ptr<Recognizer> recognizer)
    : config_(std::move(config)), recognizer_(std::move(recognizer)),
      dispatcher_(*recognizer_,
                  // NotifyCallback, runs on the dispatcher worker
                  [this]() {
                      uint64_t val = 1;
                      if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                          logging::error("eventfd write failed: {}", std::strerror(errno));
                      }
                  }),
      manager_({.default_sample_rate = config_.session.sample_rate,
                .dispatch_threshold_bytes = config_.session.dispatch_threshold_bytes},
               registry_, dispatcher_,
               [this](SessionId id, const std::string& payload) {
                   return send_to_session(id, payload);
               }) {}

ServerLoop::~ServerLoop() {
    dispatcher_.shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (stop_event_fd_ >= 0) ::close(stop_event_fd_);
}

bool ServerLoop::init() {
    // Block the signals before any thread exists, so only signalfd sees them
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (int err = pthread_sigmask(SIG_BLOCK, &mask, nullptr); err != 0) {
        logging::error("pthread_sigmask failed: {}", std::strerror(err));
        return false;
    }

    // Worker notification eventfd, created before anything can be dispatched
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        logging::error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    stop_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_event_fd_ < 0) {
        logging::error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (!frame_server_.start(config_.listen.host, config_.listen.port)) {
        logging::error("cannot listen on {}:{}", config_.listen.host, config_.listen.port);
        return false;
    }
    logging::info("listening on {}:{}", config_.listen.host, frame_server_.port());

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        logging::error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        logging::error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            logging::error("epoll_ctl add {} failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(frame_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(stop_event_fd_, EPOLLIN)) {
        return false;
    }

    dispatcher_.start();
    running_.store(true, std::memory_order_release);
    return true;
}

void ServerLoop::run() {
    constexpr int MAX_EVENTS = 64;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    logging::info("received signal {}, shutting down", info.ssi_signo);
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == stop_event_fd_) {
                uint64_t val;
                if (::read(stop_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    logging::error("eventfd read failed: {}", std::strerror(errno));
                }
                break;
            }

            if (fd == frame_server_.server_fd()) {
                accept_connection();
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    logging::error("eventfd read failed: {}", std::strerror(errno));
                }
                manager_.deliver_results();
                for (int failed : std::exchange(failed_fds_, {})) close_connection(failed);
                continue;
            }

            // Client fd; it may have been closed earlier in this batch
            if (fd_sessions_.contains(fd) && (events[i].events & EPOLLOUT)) {
                write_connection(fd);
            }
            if (fd_sessions_.contains(fd) && (events[i].events & ~EPOLLOUT)) {
                read_connection(fd);
            }
        }
    }

    // Clean shutdown: buffered audio of live sessions is discarded
    std::vector<int> open_fds;
    for (auto& [fd, _] : fd_sessions_) open_fds.push_back(fd);
    for (int fd : open_fds) close_connection(fd);
    dispatcher_.shutdown();
}

void ServerLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    if (stop_event_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(stop_event_fd_, &val, sizeof(val)) < 0) {
            logging::error("eventfd write failed: {}", std::strerror(errno));
        }
    }
}

void ServerLoop::accept_connection() {
    while (true) {
        int client_fd = frame_server_.accept_client();
        if (client_fd < 0) return;

        epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
            logging::error("epoll_ctl add client failed: {}", std::strerror(errno));
            frame_server_.close_client(client_fd);
            continue;
        }

        auto id = manager_.open_session();
        fd_sessions_[client_fd] = id;
        session_fds_[id] = client_fd;
    }
}

void ServerLoop::read_connection(int fd) {
    auto id = fd_sessions_.at(fd);

    std::vector<protocol::Frame> frames;
    bool alive = frame_server_.read_frames(fd, frames);

    // Frames received before a disconnect are still processed in order
    for (auto& frame : frames) {
        manager_.on_frame(id, frame);
    }

    if (!alive) {
        close_connection(fd);
    }
}

void ServerLoop::write_connection(int fd) {
    if (!frame_server_.flush(fd)) {
        close_connection(fd);
        return;
    }
    if (!frame_server_.has_pending_output(fd)) watch_output(fd, false);
}

void ServerLoop::watch_output(int fd, bool enabled) {
    epoll_event ev{.events = EPOLLIN | EPOLLRDHUP | (enabled ? EPOLLOUT : 0u), .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
        logging::error("epoll_ctl mod {} failed: {}", fd, std::strerror(errno));
    }
}

void ServerLoop::close_connection(int fd) {
    auto it = fd_sessions_.find(fd);
    if (it == fd_sessions_.end()) return;

    auto id = it->second;
    fd_sessions_.erase(it);
    session_fds_.erase(id);

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    frame_server_.close_client(fd);
    manager_.close_session(id);
}

bool ServerLoop::send_to_session(SessionId id, const std::string& payload) {
    auto it = session_fds_.find(id);
    if (it == session_fds_.end()) return false;

    int fd = it->second;
    if (!frame_server_.send_frame(fd, protocol::FrameType::Text, payload)) {
        failed_fds_.push_back(fd);
        return false;
    }
    // The rest goes out when the socket is writable again
    if (frame_server_.has_pending_output(fd)) watch_output(fd, true);
    return true;
}
