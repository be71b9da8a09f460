/*
 * TCP Line Transport
 *
 * Blocking POSIX stream sockets carrying newline-delimited text frames.
 * Each frame is one JSON message; a frame longer than MAX_LINE_LENGTH is a
 * protocol error.
 */

#ifndef TCP_SOCKET_HPP
#define TCP_SOCKET_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace input_link {

constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

class TcpConnection {
public:
    enum class ReadResult {
        Line,
        Timeout,
        Closed,
        Error
    };

    TcpConnection(int fd, std::string peer);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // Writes line + '\n'. Safe to call from several threads.
    bool sendLine(const std::string& line);

    // Reads the next frame into out, waiting at most timeout_ms (-1 = forever).
    // Only one thread may read.
    ReadResult readLine(std::string& out, int timeout_ms);

    // Wakes any blocked reader; later sends fail. The descriptor is closed by
    // the destructor.
    void shutdown();

    bool isOpen() const { return !shut_down_; }
    const std::string& peer() const { return peer_; }

private:
    bool takeBufferedLine(std::string& out);

    int fd_;
    std::string peer_;
    std::string buffer_;
    std::mutex send_mutex_;
    std::atomic<bool> shut_down_;
};

// Resolves host and connects within timeout_ms. Returns nullptr (and logs) on failure.
std::unique_ptr<TcpConnection> connect_tcp(const std::string& host, unsigned short port, int timeout_ms);

class TcpListener {
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Port 0 picks an ephemeral port; see port()
    bool listen(const std::string& host, unsigned short port, int backlog = 16);

    // Waits up to timeout_ms for a client. nullptr on timeout or error.
    std::unique_ptr<TcpConnection> accept(int timeout_ms);

    void close();

    bool isListening() const { return sock_ >= 0; }
    unsigned short port() const { return port_; }

private:
    int sock_;
    unsigned short port_;
};

}  // namespace input_link

#endif // TCP_SOCKET_HPP
