#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "uring_io.h"
#include "../shared/scoped_fd.h"
#include "../shared/tls_context.h"

enum class io_result : uint8_t
{
    ok          = 0,
    closed      = 1,    // peer hung up, or close() was called
    timed_out   = 2,    // idle deadline expired
    interrupted = 3,    // interrupt_read() was called
    error       = 4
};

const char* io_result_name(io_result r);

// The single server connection: plain TCP or TLS over TCP, either dialed
// fresh or adopted from an inherited descriptor.
//
// One thread reads (read_line); any number of threads may write. Writes
// are serialized internally, one complete buffer per call. Every
// successful line read or write pushes the idle deadline forward; once it
// passes, the next read or write fails with timed_out.
class connection
{
public:
    static constexpr std::chrono::milliseconds DEFAULT_IDLE_TIMEOUT{10 * 60 * 1000};
    static constexpr size_t MAX_PARTIAL_SIZE = 64 * 1024;

    explicit connection(std::chrono::milliseconds idle_timeout = DEFAULT_IDLE_TIMEOUT);
    ~connection();

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    // address is "host:port" ("[v6addr]:port" for literal IPv6).
    // With tls set, the TLS handshake completes before this returns.
    bool dial(std::string_view address, const tls_context* tls = nullptr);

    // Takes ownership of an already-connected stream socket. On failure the
    // descriptor stays with the caller. host is only used for TLS server
    // name checks.
    bool adopt(int fd, const tls_context* tls = nullptr, std::string_view host = {});

    // Blocks until a full '\n'-terminated line is available. The line is
    // returned without its terminator and trailing whitespace.
    io_result read_line(std::string& line);

    io_result write(std::string_view data);

    // Makes a blocked (or the next) read_line return interrupted.
    void interrupt_read();

    // Idempotent. The reader must have stopped before the descriptor goes.
    void close();

    int fd() const { return m_fd.get(); }
    bool is_open() const { return m_fd && !m_closed.load(std::memory_order_acquire); }
    bool is_tls() const { return static_cast<bool>(m_tls); }

    std::chrono::milliseconds idle_timeout() const { return m_idle_timeout; }

private:
    bool prepare(const tls_context* tls, std::string_view host);
    bool handshake();

    io_result fill_plain();
    io_result fill_tls();
    io_result send_all(std::string_view data);
    io_result map_error(int res) const;

    // One recv/send bounded by the idle deadline as it stands when the
    // timeout fires, not when the call started. -ETIME once it has passed.
    int recv_some(char* buf, uint32_t len);
    int send_some(const char* buf, uint32_t len);

    // Remaining time before the idle deadline; <= 0 means expired.
    std::chrono::milliseconds remaining() const;
    void touch();

    std::chrono::milliseconds m_idle_timeout;
    scoped_fd m_fd;
    tls_session m_tls;

    uring_io m_read_io;
    uring_io m_write_io;

    std::string m_rbuf;

    std::mutex m_write_mutex;
    std::mutex m_tls_mutex;     // a session is not safe for concurrent read and write

    std::atomic<int64_t> m_deadline_ns{0};
    std::atomic<bool> m_closed{false};
};
