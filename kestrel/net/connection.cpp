#include "connection.h"
#include "../shared/logging.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <charconv>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

const char* io_result_name(io_result r)
{
    switch (r)
    {
        case io_result::ok:          return "ok";
        case io_result::closed:      return "closed";
        case io_result::timed_out:   return "timed out";
        case io_result::interrupted: return "interrupted";
        case io_result::error:       return "error";
    }
    return "unknown";
}

connection::connection(std::chrono::milliseconds idle_timeout)
    : m_idle_timeout(idle_timeout)
{
}

connection::~connection()
{
    close();
}

static bool split_address(std::string_view address, std::string& host, std::string& port)
{
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= address.size())
        return false;

    std::string_view h = address.substr(0, colon);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']')
        h = h.substr(1, h.size() - 2);

    std::string_view p = address.substr(colon + 1);
    uint32_t parsed = 0;
    auto [ptr, ec] = std::from_chars(p.data(), p.data() + p.size(), parsed);
    if (ec != std::errc{} || ptr != p.data() + p.size() || parsed == 0 || parsed > 65535)
        return false;

    host = std::string(h);
    port = std::string(p);
    return true;
}

bool connection::dial(std::string_view address, const tls_context* tls)
{
    std::string host, port;
    if (!split_address(address, host, port))
    {
        LOG_ERRORF("[conn] invalid address: %s", std::string(address).c_str());
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0)
    {
        LOG_ERRORF("[conn] resolve %s: %s", host.c_str(), gai_strerror(rc));
        return false;
    }

    scoped_fd sock;
    int last_errno = 0;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next)
    {
        scoped_fd s(socket(ai->ai_family, SOCK_STREAM | SOCK_CLOEXEC, ai->ai_protocol));
        if (!s)
        {
            last_errno = errno;
            continue;
        }

        if (connect(s.get(), ai->ai_addr, ai->ai_addrlen) == 0)
        {
            sock = std::move(s);
            break;
        }
        last_errno = errno;
    }
    freeaddrinfo(res);

    if (!sock)
    {
        LOG_ERRORF("[conn] connect %s: %s", std::string(address).c_str(), std::strerror(last_errno));
        return false;
    }

    int opt = 1;
    setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    setsockopt(sock.get(), SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

    m_fd = std::move(sock);
    if (!prepare(tls, host))
    {
        m_fd.reset();
        return false;
    }
    return true;
}

bool connection::adopt(int fd, const tls_context* tls, std::string_view host)
{
    if (fd < 0)
        return false;

    int type = 0;
    socklen_t len = sizeof(type);
    if (getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &len) < 0 || type != SOCK_STREAM)
    {
        LOG_ERRORF("[conn] descriptor %d is not a stream socket", fd);
        return false;
    }

    m_fd.reset(fd);

    // Only the handoff path may pass it on, and it does so explicitly.
    if (!m_fd.set_cloexec(true))
        LOG_WARNF("[conn] could not set close-on-exec on %d", fd);

    if (!prepare(tls, host))
    {
        m_fd.release();
        return false;
    }
    return true;
}

bool connection::prepare(const tls_context* tls, std::string_view host)
{
    m_closed.store(false, std::memory_order_release);
    m_rbuf.clear();
    m_rbuf.reserve(4096);

    if (!m_read_io.init() || !m_write_io.init())
        return false;

    touch();

    if (!tls)
        return true;

    m_tls = tls->create_session(host);
    if (!m_tls)
    {
        LOG_ERRORF("[conn] TLS setup failed: %s", tls_context::last_error().c_str());
        return false;
    }

    if (!handshake())
    {
        LOG_ERRORF("[conn] TLS handshake failed: %s", tls_context::last_error().c_str());
        m_tls.reset();
        return false;
    }

    touch();
    return true;
}

bool connection::handshake()
{
    char buf[4096];
    while (true)
    {
        tls_status hs = m_tls.handshake();

        std::string out;
        m_tls.drain(out);
        if (!out.empty() && send_all(out) != io_result::ok)
            return false;

        if (hs != tls_status::want_more)
            return hs == tls_status::done;

        int r = recv_some(buf, sizeof(buf));
        if (r <= 0)
            return false;
        if (!m_tls.feed(buf, static_cast<size_t>(r)))
            return false;
    }
}

std::chrono::milliseconds connection::remaining() const
{
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    auto left = std::chrono::nanoseconds(m_deadline_ns.load(std::memory_order_acquire)) - now;
    return std::chrono::duration_cast<std::chrono::milliseconds>(left);
}

int connection::recv_some(char* buf, uint32_t len)
{
    // The armed timeout is only a lower bound: a write may have pushed the
    // deadline forward while the recv was pending.
    while (true)
    {
        auto left = remaining();
        if (left.count() <= 0)
            return -ETIME;

        int n = m_read_io.recv(m_fd.get(), buf, len, left);
        if (n != -ETIME)
            return n;
    }
}

int connection::send_some(const char* buf, uint32_t len)
{
    while (true)
    {
        auto left = remaining();
        if (left.count() <= 0)
            return -ETIME;

        int n = m_write_io.send(m_fd.get(), buf, len, left);
        if (n != -ETIME)
            return n;
    }
}

void connection::touch()
{
    auto deadline = std::chrono::steady_clock::now().time_since_epoch() + m_idle_timeout;
    m_deadline_ns.store(std::chrono::duration_cast<std::chrono::nanoseconds>(deadline).count(),
                        std::memory_order_release);
}

io_result connection::map_error(int res) const
{
    switch (res)
    {
        case 0:           return io_result::closed;
        case -ETIME:      return io_result::timed_out;
        case -EINTR:      return io_result::interrupted;
        case -EPIPE:
        case -ECONNRESET:
        case -EBADF:      return io_result::closed;
        default:          return io_result::error;
    }
}

io_result connection::read_line(std::string& line)
{
    while (true)
    {
        auto nl = m_rbuf.find('\n');
        if (nl != std::string::npos)
        {
            size_t end = nl;
            while (end > 0 && std::isspace(static_cast<unsigned char>(m_rbuf[end - 1])))
                --end;
            line.assign(m_rbuf, 0, end);
            m_rbuf.erase(0, nl + 1);
            touch();
            return io_result::ok;
        }

        if (m_rbuf.size() > MAX_PARTIAL_SIZE)
        {
            LOG_WARN("[conn] line exceeds read buffer limit");
            return io_result::error;
        }

        if (!is_open())
            return io_result::closed;

        io_result r = m_tls ? fill_tls() : fill_plain();
        if (r != io_result::ok)
            return r;
    }
}

io_result connection::fill_plain()
{
    char buf[4096];
    int n = recv_some(buf, sizeof(buf));
    if (n <= 0)
        return map_error(n);

    m_rbuf.append(buf, static_cast<size_t>(n));
    return io_result::ok;
}

io_result connection::fill_tls()
{
    // Drain what OpenSSL already buffered before touching the socket
    std::string pending_out;
    tls_status st;
    {
        std::lock_guard<std::mutex> lock(m_tls_mutex);
        st = m_tls.read(m_rbuf);
        if (st == tls_status::failed)
            return io_result::closed;
        m_tls.drain(pending_out);
    }

    // Protocol records owed to the peer (key updates and the like)
    if (!pending_out.empty())
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        io_result r = send_all(pending_out);
        if (r != io_result::ok)
            return r;
    }

    if (st == tls_status::done)
        return io_result::ok;

    char buf[4096];
    int n = recv_some(buf, sizeof(buf));
    if (n <= 0)
        return map_error(n);

    std::lock_guard<std::mutex> lock(m_tls_mutex);
    if (!m_tls.feed(buf, static_cast<size_t>(n)))
        return io_result::error;
    return io_result::ok;
}

io_result connection::send_all(std::string_view data)
{
    size_t off = 0;
    while (off < data.size())
    {
        int n = send_some(data.data() + off, static_cast<uint32_t>(data.size() - off));
        if (n <= 0)
            return map_error(n == 0 ? -EPIPE : n);
        off += static_cast<size_t>(n);
    }
    return io_result::ok;
}

io_result connection::write(std::string_view data)
{
    if (data.empty())
        return io_result::error;

    std::lock_guard<std::mutex> lock(m_write_mutex);
    if (!is_open())
        return io_result::closed;

    io_result r;
    if (m_tls)
    {
        std::string cipher;
        {
            std::lock_guard<std::mutex> tls_lock(m_tls_mutex);
            if (!m_tls.write(data))
                return io_result::error;
            m_tls.drain(cipher);
        }
        r = send_all(cipher);
    }
    else
    {
        r = send_all(data);
    }

    if (r == io_result::ok)
        touch();
    return r;
}

void connection::interrupt_read()
{
    m_read_io.interrupt();
}

void connection::close()
{
    if (m_closed.exchange(true, std::memory_order_acq_rel))
        return;

    m_read_io.interrupt();

    std::lock_guard<std::mutex> lock(m_write_mutex);
    {
        std::lock_guard<std::mutex> tls_lock(m_tls_mutex);
        m_tls.reset();
    }
    m_fd.reset();
}
