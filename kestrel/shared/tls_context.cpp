#include "tls_context.h"
#include "logging.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>

#include <utility>

// ─── tls_session ───

tls_session::tls_session(tls_session&& other) noexcept
    : m_ssl(std::exchange(other.m_ssl, nullptr))
{
}

tls_session& tls_session::operator=(tls_session&& other) noexcept
{
    if (this != &other)
    {
        reset();
        m_ssl = std::exchange(other.m_ssl, nullptr);
    }
    return *this;
}

void tls_session::reset()
{
    if (m_ssl)
        SSL_free(m_ssl);    // also frees both BIOs
    m_ssl = nullptr;
}

static tls_status classify(SSL* ssl, int ret)
{
    switch (SSL_get_error(ssl, ret))
    {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return tls_status::want_more;
        default:
            return tls_status::failed;
    }
}

tls_status tls_session::handshake()
{
    int ret = SSL_do_handshake(m_ssl);
    return ret == 1 ? tls_status::done : classify(m_ssl, ret);
}

tls_status tls_session::read(std::string& out)
{
    char buf[4096];
    bool got = false;
    while (true)
    {
        int n = SSL_read(m_ssl, buf, sizeof(buf));
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            got = true;
            continue;
        }

        tls_status st = classify(m_ssl, n);
        if (st == tls_status::failed)
            return st;
        return got ? tls_status::done : tls_status::want_more;
    }
}

bool tls_session::write(std::string_view plain)
{
    // The memory BIO grows as needed, so SSL_write never stops short
    size_t off = 0;
    while (off < plain.size())
    {
        size_t written = 0;
        if (SSL_write_ex(m_ssl, plain.data() + off, plain.size() - off, &written) != 1)
            return false;
        off += written;
    }
    return true;
}

void tls_session::drain(std::string& out)
{
    BIO* wbio = SSL_get_wbio(m_ssl);
    char buf[4096];
    int n;
    while (wbio && (n = BIO_read(wbio, buf, sizeof(buf))) > 0)
        out.append(buf, static_cast<size_t>(n));
}

bool tls_session::feed(const char* data, size_t len)
{
    BIO* rbio = SSL_get_rbio(m_ssl);
    size_t written = 0;
    return rbio && BIO_write_ex(rbio, data, len, &written) == 1 && written == len;
}

// ─── tls_context ───

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

bool tls_context::init_client(std::string_view client_cert,
                              std::string_view client_key,
                              std::string_view ca_path)
{
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx)
    {
        LOG_ERRORF("[tls] failed to create SSL context: %s", last_error().c_str());
        return false;
    }

    auto fail = [ctx](const char* what, std::string_view path) {
        LOG_ERRORF("[tls] %s %s: %s", what, std::string(path).c_str(), last_error().c_str());
        SSL_CTX_free(ctx);
        return false;
    };

    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

#if defined(SSL_OP_NO_RENEGOTIATION)
    SSL_CTX_set_options(ctx, SSL_OP_NO_RENEGOTIATION);
#endif
    SSL_CTX_set_mode(ctx, SSL_MODE_RELEASE_BUFFERS | SSL_MODE_AUTO_RETRY);

    if (!ca_path.empty())
    {
        if (SSL_CTX_load_verify_locations(ctx, std::string(ca_path).c_str(), nullptr) <= 0)
            return fail("failed to load CA file", ca_path);
    }
    else if (SSL_CTX_set_default_verify_paths(ctx) != 1)
    {
        LOG_WARN("[tls] could not load the system trust store");
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);

    if (!client_cert.empty() && !client_key.empty())
    {
        if (SSL_CTX_use_certificate_chain_file(ctx, std::string(client_cert).c_str()) <= 0)
            return fail("failed to load client certificate", client_cert);
        if (SSL_CTX_use_PrivateKey_file(ctx, std::string(client_key).c_str(), SSL_FILETYPE_PEM) <= 0)
            return fail("failed to load client key", client_key);
        if (!SSL_CTX_check_private_key(ctx))
            return fail("private key does not match", client_cert);
    }

    if (m_ctx)
        SSL_CTX_free(m_ctx);
    m_ctx = ctx;
    return true;
}

tls_session tls_context::create_session(std::string_view host) const
{
    if (!m_ctx)
        return {};

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
        return {};

    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio)
    {
        BIO_free(rbio);
        BIO_free(wbio);
        SSL_free(ssl);
        return {};
    }

    // An empty input BIO means "wait for the socket", not EOF
    BIO_set_mem_eof_return(rbio, -1);
    BIO_set_mem_eof_return(wbio, -1);
    SSL_set_bio(ssl, rbio, wbio);

    tls_session session(ssl);

    if (!host.empty())
    {
        std::string h(host);
        if (SSL_set_tlsext_host_name(ssl, h.c_str()) != 1 || SSL_set1_host(ssl, h.c_str()) != 1)
        {
            LOG_ERRORF("[tls] invalid server name %s", h.c_str());
            return {};
        }
    }

    SSL_set_connect_state(ssl);
    return session;
}

std::string tls_context::last_error()
{
    unsigned long code = ERR_get_error();
    if (code == 0)
        return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}
