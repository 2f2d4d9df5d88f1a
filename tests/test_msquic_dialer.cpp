// Copyright (c) 2025 The global-monitor authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "gmon/probe/msquic_dialer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using boost::asio::ip::make_address_v4;


namespace {

gmon::SourceResolver::InterfaceLookup loopbackLookup()
{
    return [] (const std::string& iface) -> gmon::Maybe<boost::asio::ip::address_v4> {
        if (iface == "lo") return make_address_v4("127.0.0.1");
        return gmon::Error(gmon::ErrorCode::InterfaceNotFound);
    };
}

/// Self-signed P-256 certificate and key written to a temporary directory.
class TempCertificate
{
public:
    TempCertificate()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "gmon-quic-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        dir = tmpl;
        certPath = (dir / "cert.pem").string();
        keyPath = (dir / "key.pem").string();

        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
        std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
        if (!key || !cert) throw std::runtime_error("can't create certificate");

        X509_set_version(cert.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
        X509_set_pubkey(cert.get(), key.get());
        auto name = X509_get_subject_name(cert.get());
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert.get(), name);
        if (!X509_sign(cert.get(), key.get(), EVP_sha256()))
            throw std::runtime_error("can't sign certificate");

        std::unique_ptr<FILE, decltype(&fclose)> keyOut(fopen(keyPath.c_str(), "w"), &fclose);
        std::unique_ptr<FILE, decltype(&fclose)> certOut(fopen(certPath.c_str(), "w"), &fclose);
        if (!keyOut || !certOut) throw std::runtime_error("can't write certificate");
        if (!PEM_write_PrivateKey(keyOut.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr)
            || !PEM_write_X509(certOut.get(), cert.get()))
            throw std::runtime_error("can't write certificate");
    }

    ~TempCertificate()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    std::string certPath;
    std::string keyPath;
};

/// QUIC listener on 127.0.0.1 accepting every connection that offers `alpn`.
class TestQuicServer
{
public:
    TestQuicServer(const TempCertificate& cert, std::string alpn)
        : alpn(std::move(alpn))
    {
        check(MsQuicOpen2(&api));
        const QUIC_REGISTRATION_CONFIG regConfig = {"gmon-test", QUIC_EXECUTION_PROFILE_LOW_LATENCY};
        check(api->RegistrationOpen(&regConfig, &registration));

        QUIC_BUFFER buf = {(uint32_t)this->alpn.size(), (uint8_t*)this->alpn.data()};
        QUIC_SETTINGS settings = {};
        settings.IdleTimeoutMs = 5000;
        settings.IsSet.IdleTimeoutMs = TRUE;
        check(api->ConfigurationOpen(registration, &buf, 1, &settings, sizeof(settings),
            nullptr, &configuration));

        QUIC_CERTIFICATE_FILE certFile = {cert.keyPath.c_str(), cert.certPath.c_str()};
        QUIC_CREDENTIAL_CONFIG cred = {};
        cred.Type = QUIC_CREDENTIAL_TYPE_CERTIFICATE_FILE;
        cred.Flags = QUIC_CREDENTIAL_FLAG_NONE;
        cred.CertificateFile = &certFile;
        check(api->ConfigurationLoadCredential(configuration, &cred));

        check(api->ListenerOpen(registration, &TestQuicServer::onListener, this, &listener));
        QUIC_ADDR addr = {};
        if (!QuicAddrFromString("127.0.0.1", 0, &addr))
            throw std::runtime_error("bad listener address");
        check(api->ListenerStart(listener, &buf, 1, &addr));

        QUIC_ADDR bound = {};
        uint32_t size = sizeof(bound);
        check(api->GetParam(listener, QUIC_PARAM_LISTENER_LOCAL_ADDRESS, &size, &bound));
        port = QuicAddrGetPort(&bound);
    }

    ~TestQuicServer()
    {
        if (listener) api->ListenerClose(listener);
        if (configuration) api->ConfigurationClose(configuration);
        if (registration) {
            api->RegistrationShutdown(registration, QUIC_CONNECTION_SHUTDOWN_FLAG_SILENT, 0);
            api->RegistrationClose(registration);
        }
        if (api) MsQuicClose(api);
    }

    TestQuicServer(const TestQuicServer&) = delete;
    TestQuicServer& operator=(const TestQuicServer&) = delete;

    std::string hostPort() const
    {
        return "127.0.0.1:" + std::to_string(port);
    }

private:
    static void check(QUIC_STATUS status)
    {
        if (QUIC_FAILED(status))
            throw std::runtime_error("MsQuic test server: " + gmon::fmtError(gmon::makeQuicError(status)));
    }

    static QUIC_STATUS QUIC_API onListener(HQUIC, void* context, QUIC_LISTENER_EVENT* event)
    {
        auto self = static_cast<TestQuicServer*>(context);
        if (event->Type != QUIC_LISTENER_EVENT_NEW_CONNECTION) return QUIC_STATUS_SUCCESS;
        auto conn = event->NEW_CONNECTION.Connection;
        self->api->SetCallbackHandler(conn, (void*)&TestQuicServer::onConnection, self);
        return self->api->ConnectionSetConfiguration(conn, self->configuration);
    }

    static QUIC_STATUS QUIC_API onConnection(HQUIC conn, void* context, QUIC_CONNECTION_EVENT* event)
    {
        auto self = static_cast<TestQuicServer*>(context);
        if (event->Type == QUIC_CONNECTION_EVENT_SHUTDOWN_COMPLETE
            && !event->SHUTDOWN_COMPLETE.AppCloseInProgress)
            self->api->ConnectionClose(conn);
        return QUIC_STATUS_SUCCESS;
    }

    std::string alpn;
    const QUIC_API_TABLE* api = nullptr;
    HQUIC registration = nullptr;
    HQUIC configuration = nullptr;
    HQUIC listener = nullptr;
    std::uint16_t port = 0;
};

gmon::QuicConfig fastQuic()
{
    gmon::QuicConfig cfg;
    cfg.keepAlivePeriod = 20ms;
    cfg.maxIdleTimeout = 2s;
    cfg.handshakeIdleTimeout = 1s;
    return cfg;
}

double dialCount(gmon::Metrics& metrics, const char* result)
{
    return metrics.tpuquicDialsTotal.Add({{"iface", "lo"}, {"result", result}}).Value();
}

} // namespace

TEST(MsQuicDialer, ErrorMapping)
{
    using namespace gmon;
    EXPECT_EQ(makeQuicError(QUIC_STATUS_CONNECTION_IDLE), ErrorCode::IdleTimeout);
    EXPECT_EQ(makeQuicError(QUIC_STATUS_CONNECTION_TIMEOUT), ErrorCode::IdleTimeout);
    EXPECT_EQ(makeQuicError(QUIC_STATUS_CONNECTION_IDLE), ErrorCondition::Timeout);

    auto refused = makeQuicError(QUIC_STATUS_CONNECTION_REFUSED);
    EXPECT_EQ(refused.category(), msquic_error_category());
    EXPECT_EQ(refused, ErrorCondition::Unavailable);
    EXPECT_EQ(refused.message(), "connection refused");
    EXPECT_EQ(makeQuicError(QUIC_STATUS_INVALID_ADDRESS), ErrorCondition::InvalidArgument);
}

TEST(MsQuicDialer, InvalidEndpoint)
{
    using namespace gmon;
    MsQuicDialer dialer(nullptr, loopbackLookup());
    for (const char* hostPort : {"", "127.0.0.1", "127.0.0.1:0", "127.0.0.1:x", ":8009",
        "localhost:8009", "[::1]:8009"})
    {
        auto conn = dialer.dial(Context(), "lo", hostPort, fastQuic());
        ASSERT_FALSE(conn.has_value()) << hostPort;
        EXPECT_EQ(conn.error(), ErrorCode::InvalidArgument) << hostPort;
    }
}

TEST(MsQuicDialer, UnknownInterface)
{
    using namespace gmon;
    Metrics metrics;
    MsQuicDialer dialer(&metrics);
    auto conn = dialer.dial(Context(), "gmon-no-such0", "127.0.0.1:8009", fastQuic());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error(), ErrorCode::InterfaceNotFound);
}

TEST(MsQuicDialer, Handshake)
{
    using namespace gmon;
    TempCertificate cert;
    TestQuicServer server(cert, std::string(SOLANA_TPU_ALPN));
    Metrics metrics;
    auto dialer = std::make_shared<MsQuicDialer>(&metrics, loopbackLookup());

    auto conn = dialer->dial(Context().withTimeout(5s), "lo", server.hostPort(), fastQuic());
    ASSERT_TRUE(conn.has_value()) << fmtError(conn.error());
    ASSERT_NE(*conn, nullptr);
    EXPECT_FALSE((*conn)->isClosed());
    EXPECT_EQ(dialCount(metrics, "ok"), 1);

    // Keep-alives produce RTT samples on the established connection.
    auto deadline = std::chrono::steady_clock::now() + 5s;
    auto stats = (*conn)->stats();
    while (quicStatsNotReady(stats) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
        stats = (*conn)->stats();
    }
    EXPECT_FALSE(quicStatsNotReady(stats));
    EXPECT_GT(stats.smoothedRtt.count(), 0);
    EXPECT_GT(stats.packetsSent, 0);
    EXPECT_GT(stats.packetsReceived, 0);

    (*conn)->close();
    EXPECT_TRUE((*conn)->isClosed());
    (*conn)->close();
}

TEST(MsQuicDialer, TargetOverLoopback)
{
    using namespace gmon;
    TempCertificate cert;
    TestQuicServer server(cert, std::string(SOLANA_TPU_ALPN));
    auto dialer = std::make_shared<MsQuicDialer>(nullptr, loopbackLookup());

    QuicTargetConfig cfg;
    cfg.quic = fastQuic();
    QuicTarget target("lo", server.hostPort(), dialer, cfg);
    auto res = target.probe(Context().withTimeout(5s));
    ASSERT_TRUE(res.has_value()) << fmtError(res.error());
    EXPECT_TRUE(res->ok) << fmtError(res->error);
    ASSERT_TRUE(res->stats.has_value());
    EXPECT_GT(res->stats->rttAvg.count(), 0);
    target.close();
}

TEST(MsQuicDialer, ClientCertificate)
{
    using namespace gmon;
    TempCertificate cert;
    TestQuicServer server(cert, std::string(SOLANA_TPU_ALPN));
    MsQuicDialer dialer(nullptr, loopbackLookup());

    auto cfg = fastQuic();
    cfg.certFile = cert.certPath;
    cfg.keyFile = cert.keyPath;
    auto conn = dialer.dial(Context().withTimeout(5s), "lo", server.hostPort(), cfg);
    ASSERT_TRUE(conn.has_value()) << fmtError(conn.error());
    (*conn)->close();

    cfg.certFile = (cert.dir / "missing.pem").string();
    auto missing = dialer.dial(Context().withTimeout(5s), "lo", server.hostPort(), cfg);
    EXPECT_FALSE(missing.has_value());
}

TEST(MsQuicDialer, AlpnMismatch)
{
    using namespace gmon;
    TempCertificate cert;
    TestQuicServer server(cert, "h3");
    Metrics metrics;
    auto dialer = std::make_shared<MsQuicDialer>(&metrics, loopbackLookup());

    auto conn = dialer->dial(Context().withTimeout(5s), "lo", server.hostPort(), fastQuic());
    ASSERT_FALSE(conn.has_value());
    EXPECT_NE(conn.error(), ErrorCode::DeadlineExceeded);
    EXPECT_EQ(dialCount(metrics, "error"), 1);

    QuicTargetConfig cfg;
    cfg.quic = fastQuic();
    QuicTarget target("lo", server.hostPort(), dialer, cfg);
    auto res = target.probe(Context().withTimeout(5s));
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->ok);
}

TEST(MsQuicDialer, SilentPeerTimesOut)
{
    using namespace gmon;
    // A bound UDP socket that never answers.
    boost::asio::io_context ioCtx;
    boost::asio::ip::udp::socket silent(ioCtx,
        boost::asio::ip::udp::endpoint(make_address_v4("127.0.0.1"), 0));
    auto hostPort = "127.0.0.1:" + std::to_string(silent.local_endpoint().port());

    MsQuicDialer dialer(nullptr, loopbackLookup());
    auto cfg = fastQuic();
    cfg.handshakeIdleTimeout = 200ms;

    auto start = std::chrono::steady_clock::now();
    auto conn = dialer.dial(Context().withTimeout(5s), "lo", hostPort, cfg);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error(), ErrorCode::IdleTimeout);
    EXPECT_EQ(conn.error(), ErrorCondition::Timeout);
    EXPECT_LT(elapsed, 3s);
}

TEST(MsQuicDialer, CancelledDial)
{
    using namespace gmon;
    boost::asio::io_context ioCtx;
    boost::asio::ip::udp::socket silent(ioCtx,
        boost::asio::ip::udp::endpoint(make_address_v4("127.0.0.1"), 0));
    auto hostPort = "127.0.0.1:" + std::to_string(silent.local_endpoint().port());

    MsQuicDialer dialer(nullptr, loopbackLookup());
    auto cfg = fastQuic();
    cfg.handshakeIdleTimeout = 10s;

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });
    auto start = std::chrono::steady_clock::now();
    auto conn = dialer.dial(Context(stop.get_token()), "lo", hostPort, cfg);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error(), ErrorCode::Cancelled);
    EXPECT_LT(elapsed, 2s);

    // A dial under an exhausted deadline does not start.
    auto expired = dialer.dial(Context().withTimeout(0ms), "lo", hostPort, cfg);
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error(), ErrorCode::DeadlineExceeded);
}
