#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../kestrel/net/connection.h"
#include "../../kestrel/shared/tls_context.h"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct pkey_free { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct x509_free { void operator()(X509* p) const { X509_free(p); } };
struct ctx_free  { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };
struct ssl_free  { void operator()(SSL* p) const { SSL_free(p); } };

// Self-signed P-256 certificate for "localhost", written to a temporary
// PEM file the client trusts as its only root.
struct test_identity
{
    std::unique_ptr<EVP_PKEY, pkey_free> key;
    std::unique_ptr<X509, x509_free> cert;
    fs::path dir;
    fs::path ca_path;

    test_identity()
    {
        key.reset(EVP_EC_gen("P-256"));
        REQUIRE(key);

        cert.reset(X509_new());
        REQUIRE(cert);
        X509_set_version(cert.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
        REQUIRE(X509_set_pubkey(cert.get(), key.get()) == 1);

        X509_NAME* name = X509_get_subject_name(cert.get());
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        REQUIRE(X509_set_issuer_name(cert.get(), name) == 1);

        X509V3_CTX v3;
        X509V3_set_ctx_nodb(&v3);
        X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);
        X509_EXTENSION* san = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name, "DNS:localhost");
        REQUIRE(san != nullptr);
        X509_add_ext(cert.get(), san, -1);
        X509_EXTENSION_free(san);

        REQUIRE(X509_sign(cert.get(), key.get(), EVP_sha256()) > 0);

        std::string tmpl = (fs::temp_directory_path() / "kestrel-tls-XXXXXX").string();
        REQUIRE(mkdtemp(tmpl.data()) != nullptr);
        dir = tmpl;
        ca_path = dir / "ca.pem";

        FILE* f = std::fopen(ca_path.c_str(), "w");
        REQUIRE(f != nullptr);
        CHECK(PEM_write_X509(f, cert.get()) == 1);
        std::fclose(f);
    }

    ~test_identity()
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::unique_ptr<SSL_CTX, ctx_free> server_context() const
    {
        std::unique_ptr<SSL_CTX, ctx_free> ctx(SSL_CTX_new(TLS_server_method()));
        REQUIRE(ctx);
        REQUIRE(SSL_CTX_use_certificate(ctx.get(), cert.get()) == 1);
        REQUIRE(SSL_CTX_use_PrivateKey(ctx.get(), key.get()) == 1);
        return ctx;
    }
};

// Accepts one TLS session on fd, answers the first line with reply.
// accepted reports whether the handshake completed.
void serve_one(SSL_CTX* ctx, int fd, std::string reply, bool& accepted, std::string& received)
{
    std::unique_ptr<SSL, ssl_free> ssl(SSL_new(ctx));
    SSL_set_fd(ssl.get(), fd);
    accepted = SSL_accept(ssl.get()) == 1;
    if (!accepted)
        return;

    char buf[256];
    while (received.find("\r\n") == std::string::npos)
    {
        int n = SSL_read(ssl.get(), buf, sizeof(buf));
        if (n <= 0)
            return;
        received.append(buf, static_cast<size_t>(n));
    }
    SSL_write(ssl.get(), reply.data(), static_cast<int>(reply.size()));
}

}

TEST_CASE("TLS over an adopted socket")
{
    test_identity id;
    auto server_ctx = id.server_context();

    tls_context tls;
    REQUIRE(tls.init_client({}, {}, id.ca_path.string()));

    int sv[2];
    REQUIRE(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0);
    scoped_fd server_fd(sv[1]);

    bool accepted = false;
    std::string received;

    SUBCASE("lines are exchanged once the certificate checks out")
    {
        std::thread server([&] {
            serve_one(server_ctx.get(), server_fd.get(), ":irc.local PONG kestrel :x\r\n", accepted, received);
        });

        connection conn;
        bool adopted = conn.adopt(sv[0], &tls, "localhost");
        if (!adopted)
            close(sv[0]);
        CHECK(adopted);
        CHECK(conn.is_tls());

        if (adopted)
        {
            CHECK(conn.write("PING :x\r\n") == io_result::ok);

            std::string line;
            CHECK(conn.read_line(line) == io_result::ok);
            CHECK(line == ":irc.local PONG kestrel :x");
        }

        server.join();
        CHECK(accepted);
        CHECK(received == "PING :x\r\n");
    }

    SUBCASE("a certificate for another host is refused")
    {
        std::thread server([&] {
            serve_one(server_ctx.get(), server_fd.get(), "unused\r\n", accepted, received);
        });

        connection conn;
        CHECK_FALSE(conn.adopt(sv[0], &tls, "irc.example.net"));
        CHECK_FALSE(conn.is_open());

        // A failed adopt leaves the socket with us
        close(sv[0]);
        server.join();
        CHECK_FALSE(accepted);
    }
}

TEST_CASE("init_client")
{
    tls_context tls;
    CHECK_FALSE(tls.is_initialized());

    SUBCASE("missing CA file")
    {
        CHECK_FALSE(tls.init_client({}, {}, "/nonexistent/ca.pem"));
        CHECK_FALSE(tls.is_initialized());
    }

    SUBCASE("system roots")
    {
        CHECK(tls.init_client());
        CHECK(tls.is_initialized());
        CHECK(static_cast<bool>(tls.create_session("irc.example.net")));
    }
}
