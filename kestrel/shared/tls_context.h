#pragma once
#include <cstdint>
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

enum class tls_status : uint8_t
{
    done      = 0,
    want_more = 1,      // needs more ciphertext from the peer
    failed    = 2       // protocol error or close_notify
};

// One client-side TLS session over a BIO memory pair. The owner moves
// ciphertext between the BIOs and the socket: drain() collects what must
// be sent, feed() hands in what was received. Not thread-safe.
class tls_session
{
public:
    tls_session() = default;
    explicit tls_session(SSL* ssl) : m_ssl(ssl) {}
    ~tls_session() { reset(); }

    tls_session(const tls_session&) = delete;
    tls_session& operator=(const tls_session&) = delete;

    tls_session(tls_session&& other) noexcept;
    tls_session& operator=(tls_session&& other) noexcept;

    explicit operator bool() const { return m_ssl != nullptr; }
    void reset();

    tls_status handshake();

    // Appends every decrypted byte available. done if anything was read.
    tls_status read(std::string& out);

    // Encrypts the whole buffer into the outgoing BIO.
    bool write(std::string_view plain);

    // Appends ciphertext owed to the peer to out.
    void drain(std::string& out);

    bool feed(const char* data, size_t len);

private:
    SSL* m_ssl{nullptr};
};

// Client-side TLS context for the server connection.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // client_cert/client_key: certificate pair presented to the server (both or neither).
    // ca_path: PEM bundle replacing the system trust store; empty keeps the system roots.
    bool init_client(std::string_view client_cert = {},
                     std::string_view client_key = {},
                     std::string_view ca_path = {});

    // host is used for SNI and certificate hostname verification.
    // An empty session on failure.
    tls_session create_session(std::string_view host) const;

    bool is_initialized() const { return m_ctx != nullptr; }

    // Oldest queued OpenSSL error as text, for logging.
    static std::string last_error();

private:
    SSL_CTX* m_ctx = nullptr;
};
