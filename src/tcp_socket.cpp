/*
 * TCP Line Transport Implementation
 */

#include "tcp_socket.hpp"
#include "logging.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace input_link {

namespace {

const char* LOG_TAG = "tcp";

std::string describe_peer(const struct sockaddr* addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    unsigned short port = 0;
    if (addr->sa_family == AF_INET) {
        auto in = reinterpret_cast<const struct sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr->sa_family == AF_INET6) {
        auto in6 = reinterpret_cast<const struct sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }
    return std::string(host) + ":" + std::to_string(port);
}

bool set_nonblocking(int fd, bool enable) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

void set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        log_warning(LOG_TAG) << "setsockopt TCP_NODELAY: " << std::strerror(errno);
    }
}

// Non-blocking connect bounded by timeout_ms; leaves fd blocking on success
bool connect_with_timeout(int fd, const struct sockaddr* addr, socklen_t len, int timeout_ms) {
    if (!set_nonblocking(fd, true)) return false;

    int r = ::connect(fd, addr, len);
    if (r < 0 && errno != EINPROGRESS) {
        return false;
    }
    if (r < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        do {
            r = ::poll(&pfd, 1, timeout_ms);
        } while (r < 0 && errno == EINTR);
        if (r == 0) {
            errno = ETIMEDOUT;
            return false;
        }
        if (r < 0) return false;

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) return false;
        if (so_error != 0) {
            errno = so_error;
            return false;
        }
    }
    return set_nonblocking(fd, false);
}

}  // namespace

TcpConnection::TcpConnection(int fd, std::string peer)
    : fd_(fd), peer_(std::move(peer)), shut_down_(false) {
}

TcpConnection::~TcpConnection() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool TcpConnection::sendLine(const std::string& line) {
    if (shut_down_) return false;

    std::string frame = line;
    frame.push_back('\n');

    std::lock_guard<std::mutex> lock(send_mutex_);
    size_t offset = 0;
    while (offset < frame.size()) {
        ssize_t sent = ::send(fd_, frame.data() + offset, frame.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            log_debug(LOG_TAG) << "send " << peer_ << ": " << std::strerror(errno);
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

bool TcpConnection::takeBufferedLine(std::string& out) {
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) return false;

    out.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }
    return true;
}

TcpConnection::ReadResult TcpConnection::readLine(std::string& out, int timeout_ms) {
    if (takeBufferedLine(out)) return ReadResult::Line;
    if (shut_down_) return ReadResult::Closed;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char chunk[4096];

    for (;;) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) return ReadResult::Timeout;
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int r = ::poll(&pfd, 1, wait_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            log_error(LOG_TAG) << "poll " << peer_ << ": " << std::strerror(errno);
            return ReadResult::Error;
        }
        if (r == 0) return ReadResult::Timeout;

        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) return ReadResult::Closed;
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (shut_down_ || errno == ECONNRESET) return ReadResult::Closed;
            log_error(LOG_TAG) << "recv " << peer_ << ": " << std::strerror(errno);
            return ReadResult::Error;
        }

        buffer_.append(chunk, static_cast<size_t>(n));
        if (takeBufferedLine(out)) return ReadResult::Line;
        if (buffer_.size() > MAX_LINE_LENGTH) {
            log_error(LOG_TAG) << "frame from " << peer_ << " exceeds " << MAX_LINE_LENGTH << " bytes";
            buffer_.clear();
            return ReadResult::Error;
        }
    }
}

void TcpConnection::shutdown() {
    if (shut_down_.exchange(true)) return;
    if (::shutdown(fd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        log_debug(LOG_TAG) << "shutdown " << peer_ << ": " << std::strerror(errno);
    }
}

std::unique_ptr<TcpConnection> connect_tcp(const std::string& host, unsigned short port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        log_error(LOG_TAG) << "getaddrinfo " << host << ": " << gai_strerror(rc);
        return nullptr;
    }

    int last_errno = 0;
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (!connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms)) {
            last_errno = errno;
            ::close(fd);
            continue;
        }
        set_nodelay(fd);
        std::string peer = describe_peer(ai->ai_addr);
        freeaddrinfo(results);
        return std::make_unique<TcpConnection>(fd, peer);
    }

    freeaddrinfo(results);
    log_warning(LOG_TAG) << "connect " << host << ":" << port << ": " << std::strerror(last_errno);
    return nullptr;
}

TcpListener::TcpListener() : sock_(-1), port_(0) {
}

TcpListener::~TcpListener() {
    close();
}

bool TcpListener::listen(const std::string& host, unsigned short port, int backlog) {
    close();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    const char* node = (host.empty() || host == "0.0.0.0") ? nullptr : host.c_str();
    if (node == nullptr) hints.ai_family = AF_INET;
    int rc = getaddrinfo(node, service.c_str(), &hints, &results);
    if (rc != 0) {
        log_error(LOG_TAG) << "getaddrinfo " << host << ": " << gai_strerror(rc);
        return false;
    }

    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            log_error(LOG_TAG) << "socket: " << std::strerror(errno);
            continue;
        }

        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            log_error(LOG_TAG) << "setsockopt SO_REUSEADDR: " << std::strerror(errno);
            ::close(fd);
            continue;
        }

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            log_error(LOG_TAG) << "bind " << host << ":" << port << ": " << std::strerror(errno);
            ::close(fd);
            continue;
        }

        if (::listen(fd, backlog) < 0) {
            log_error(LOG_TAG) << "listen: " << std::strerror(errno);
            ::close(fd);
            continue;
        }

        struct sockaddr_storage bound;
        socklen_t bound_len = sizeof(bound);
        if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
            if (bound.ss_family == AF_INET) {
                port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
            } else if (bound.ss_family == AF_INET6) {
                port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port);
            }
        } else {
            port_ = port;
        }

        sock_ = fd;
        freeaddrinfo(results);
        return true;
    }

    freeaddrinfo(results);
    return false;
}

std::unique_ptr<TcpConnection> TcpListener::accept(int timeout_ms) {
    if (sock_ < 0) return nullptr;

    struct pollfd pfd;
    pfd.fd = sock_;
    pfd.events = POLLIN;
    int r = ::poll(&pfd, 1, timeout_ms);
    if (r < 0) {
        if (errno != EINTR) {
            log_error(LOG_TAG) << "poll: " << std::strerror(errno);
        }
        return nullptr;
    }
    if (r == 0) return nullptr;

    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    int fd = ::accept(sock_, reinterpret_cast<struct sockaddr*>(&addr), &len);
    if (fd < 0) {
        if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
            log_error(LOG_TAG) << "accept: " << std::strerror(errno);
        }
        return nullptr;
    }

    set_nodelay(fd);
    return std::make_unique<TcpConnection>(fd, describe_peer(reinterpret_cast<struct sockaddr*>(&addr)));
}

void TcpListener::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

}  // namespace input_link
