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

#include <boost/asio/ip/address.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;


namespace gmon {

namespace {

struct StatusMessage
{
    QUIC_STATUS status;
    const char* message;
};

const StatusMessage STATUS_MESSAGES[] = {
    {QUIC_STATUS_SUCCESS, "success"},
    {QUIC_STATUS_ABORTED, "aborted"},
    {QUIC_STATUS_INVALID_PARAMETER, "invalid parameter"},
    {QUIC_STATUS_INVALID_STATE, "invalid state"},
    {QUIC_STATUS_OUT_OF_MEMORY, "out of memory"},
    {QUIC_STATUS_ADDRESS_IN_USE, "address in use"},
    {QUIC_STATUS_INVALID_ADDRESS, "invalid address"},
    {QUIC_STATUS_CONNECTION_REFUSED, "connection refused"},
    {QUIC_STATUS_CONNECTION_TIMEOUT, "handshake timeout"},
    {QUIC_STATUS_CONNECTION_IDLE, "timeout: no recent network activity"},
    {QUIC_STATUS_UNREACHABLE, "destination unreachable"},
    {QUIC_STATUS_PROTOCOL_ERROR, "protocol error"},
    {QUIC_STATUS_VER_NEG_ERROR, "version negotiation failed"},
    {QUIC_STATUS_ALPN_NEG_FAILURE, "ALPN negotiation failed"},
    {QUIC_STATUS_HANDSHAKE_FAILURE, "handshake failed"},
    {QUIC_STATUS_INTERNAL_ERROR, "internal error"},
};

struct MsQuicErrorCategory : public std::error_category
{
    const char* name() const noexcept override
    {
        return "msquic";
    }

    std::string message(int code) const override
    {
        for (const auto& entry : STATUS_MESSAGES) {
            if ((int)entry.status == code) return entry.message;
        }
        return fmt::format("QUIC status {}", code);
    }

    bool equivalent(int code, const std::error_condition& cond) const noexcept override
    {
        if (cond.category() != gmon_error_condition()) return false;
        const auto value = static_cast<ErrorCondition>(cond.value());
        const auto status = static_cast<QUIC_STATUS>(code);
        if (status == QUIC_STATUS_CONNECTION_IDLE || status == QUIC_STATUS_CONNECTION_TIMEOUT)
            return value == ErrorCondition::Timeout;
        if (status == QUIC_STATUS_CONNECTION_REFUSED || status == QUIC_STATUS_UNREACHABLE)
            return value == ErrorCondition::Unavailable;
        if (status == QUIC_STATUS_INVALID_PARAMETER || status == QUIC_STATUS_INVALID_ADDRESS)
            return value == ErrorCondition::InvalidArgument;
        return false;
    }
};

} // namespace

const std::error_category& msquic_error_category()
{
    static const MsQuicErrorCategory category;
    return category;
}

std::error_code makeQuicError(QUIC_STATUS status)
{
    if (status == QUIC_STATUS_CONNECTION_IDLE || status == QUIC_STATUS_CONNECTION_TIMEOUT)
        return ErrorCode::IdleTimeout;
    return std::error_code((int)status, msquic_error_category());
}

namespace details {

/// \brief MsQuic API table and the registration all connections belong to.
/// Closing the registration waits for all of its connections to be closed.
class MsQuicLibrary
{
public:
    MsQuicLibrary()
    {
        auto status = MsQuicOpen2(&api);
        if (QUIC_FAILED(status)) {
            throw std::runtime_error(fmt::format(
                "can't open MsQuic: {}", fmtError(makeQuicError(status))));
        }
        const QUIC_REGISTRATION_CONFIG regConfig = {
            "global-monitor", QUIC_EXECUTION_PROFILE_LOW_LATENCY
        };
        status = api->RegistrationOpen(&regConfig, &registration);
        if (QUIC_FAILED(status)) {
            MsQuicClose(api);
            throw std::runtime_error(fmt::format(
                "can't open MsQuic registration: {}", fmtError(makeQuicError(status))));
        }
    }

    ~MsQuicLibrary()
    {
        api->RegistrationClose(registration);
        MsQuicClose(api);
    }

    MsQuicLibrary(const MsQuicLibrary&) = delete;
    MsQuicLibrary& operator=(const MsQuicLibrary&) = delete;

    const QUIC_API_TABLE* api = nullptr;
    HQUIC registration = nullptr;
};

} // namespace details

namespace {

std::uint64_t toMs(std::chrono::nanoseconds d)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    return (std::uint64_t)std::max<std::int64_t>(ms, 1);
}

Maybe<std::pair<std::string, std::uint16_t>> parseHostPort(const std::string& hostPort)
{
    auto colon = hostPort.rfind(':');
    if (colon == std::string::npos || colon == 0) return Error(ErrorCode::InvalidArgument);
    std::uint16_t port = 0;
    auto portStr = std::string_view(hostPort).substr(colon + 1);
    auto [ptr, err] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
    if (err != std::errc() || ptr != portStr.data() + portStr.size() || port == 0)
        return Error(ErrorCode::InvalidArgument);
    auto host = hostPort.substr(0, colon);
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host, ec);
    if (ec || !addr.is_v4()) return Error(ErrorCode::InvalidArgument);
    return std::make_pair(host, port);
}

/// \brief Open a client configuration carrying the TPU ALPN, the timeouts of
/// `cfg` and optionally a client certificate.
Maybe<HQUIC> openConfiguration(const details::MsQuicLibrary& lib, const QuicConfig& cfg)
{
    QUIC_BUFFER alpn = {(uint32_t)SOLANA_TPU_ALPN.size(), (uint8_t*)SOLANA_TPU_ALPN.data()};

    QUIC_SETTINGS settings = {};
    settings.IdleTimeoutMs = toMs(cfg.maxIdleTimeout);
    settings.IsSet.IdleTimeoutMs = TRUE;
    settings.HandshakeIdleTimeoutMs = toMs(cfg.handshakeIdleTimeout);
    settings.IsSet.HandshakeIdleTimeoutMs = TRUE;
    settings.KeepAliveIntervalMs = (uint32_t)toMs(cfg.keepAlivePeriod);
    settings.IsSet.KeepAliveIntervalMs = TRUE;
    settings.PeerBidiStreamCount = 0;
    settings.IsSet.PeerBidiStreamCount = TRUE;
    settings.PeerUnidiStreamCount = 0;
    settings.IsSet.PeerUnidiStreamCount = TRUE;

    HQUIC configuration = nullptr;
    auto status = lib.api->ConfigurationOpen(lib.registration, &alpn, 1,
        &settings, sizeof(settings), nullptr, &configuration);
    if (QUIC_FAILED(status)) return Error(makeQuicError(status));

    QUIC_CERTIFICATE_FILE certFile = {cfg.keyFile.c_str(), cfg.certFile.c_str()};
    QUIC_CREDENTIAL_CONFIG cred = {};
    cred.Flags = static_cast<QUIC_CREDENTIAL_FLAGS>(
        QUIC_CREDENTIAL_FLAG_CLIENT | QUIC_CREDENTIAL_FLAG_NO_CERTIFICATE_VALIDATION);
    if (cfg.certFile.empty()) {
        cred.Type = QUIC_CREDENTIAL_TYPE_NONE;
    } else {
        cred.Type = QUIC_CREDENTIAL_TYPE_CERTIFICATE_FILE;
        cred.CertificateFile = &certFile;
    }
    status = lib.api->ConfigurationLoadCredential(configuration, &cred);
    if (QUIC_FAILED(status)) {
        lib.api->ConfigurationClose(configuration);
        return Error(makeQuicError(status));
    }
    return configuration;
}

class MsQuicConnection : public QuicConnection
{
public:
    MsQuicConnection(std::shared_ptr<details::MsQuicLibrary> lib, HQUIC configuration)
        : lib(std::move(lib)), configuration(configuration)
    {}

    ~MsQuicConnection()
    {
        // Blocks until MsQuic delivered the last event for this connection.
        if (connection) lib->api->ConnectionClose(connection);
        if (configuration) lib->api->ConfigurationClose(configuration);
    }

    MsQuicConnection(const MsQuicConnection&) = delete;
    MsQuicConnection& operator=(const MsQuicConnection&) = delete;

    std::error_code start(const boost::asio::ip::address_v4& local,
        const std::string& host, std::uint16_t port)
    {
        auto api = lib->api;
        auto status = api->ConnectionOpen(lib->registration, &MsQuicConnection::callback,
            this, &connection);
        if (QUIC_FAILED(status)) {
            connection = nullptr;
            return makeQuicError(status);
        }

        QUIC_ADDR localAddr = {};
        if (!QuicAddrFromString(local.to_string().c_str(), 0, &localAddr))
            return ErrorCode::InvalidArgument;
        status = api->SetParam(connection, QUIC_PARAM_CONN_LOCAL_ADDRESS,
            sizeof(localAddr), &localAddr);
        if (QUIC_FAILED(status)) return makeQuicError(status);

        status = api->ConnectionStart(connection, configuration,
            QUIC_ADDRESS_FAMILY_INET, host.c_str(), port);
        if (QUIC_FAILED(status)) return makeQuicError(status);
        return ErrorCode::Ok;
    }

    /// \brief Block until the handshake completed, the connection was shut
    /// down, or `ctx` is done. MsQuic bounds the handshake by the handshake
    /// idle timeout.
    std::error_code waitConnected(const Context& ctx)
    {
        std::unique_lock lock(mutex);
        auto done = [this] { return connected || closed; };
        if (auto deadline = ctx.deadline(); deadline)
            cv.wait_until(lock, ctx.stopToken(), *deadline, done);
        else
            cv.wait(lock, ctx.stopToken(), done);

        if (closed) return closeReason;
        if (connected) return ErrorCode::Ok;
        if (ctx.cancelled()) return ErrorCode::Cancelled;
        return ErrorCode::DeadlineExceeded;
    }

    bool isClosed() const override
    {
        std::lock_guard lock(mutex);
        return closed;
    }

    QuicConnectionStats stats() const override
    {
        if (!connection) return {};
        QUIC_STATISTICS_V2 qs = {};
        uint32_t size = sizeof(qs);
        auto status = lib->api->GetParam(connection, QUIC_PARAM_CONN_STATISTICS_V2, &size, &qs);
        if (QUIC_FAILED(status)) {
            spdlog::debug("tpuquic: can't read connection statistics: {}",
                fmtError(makeQuicError(status)));
            return {};
        }

        QuicConnectionStats st;
        // MinRtt stays at its maximum until the first sample.
        if (qs.MinRtt != UINT32_MAX) st.minRtt = std::chrono::microseconds(qs.MinRtt);
        st.smoothedRtt = std::chrono::microseconds(qs.Rtt);
        // MsQuic exposes the smoothed estimate only.
        st.latestRtt = st.smoothedRtt;
        st.meanDeviation = std::chrono::microseconds(qs.RttVariance);
        st.packetsSent = qs.SendTotalPackets;
        st.packetsReceived = qs.RecvTotalPackets;
        return st;
    }

    void close() override
    {
        {
            std::lock_guard lock(mutex);
            if (shutdownRequested) return;
            shutdownRequested = true;
            if (!closed) {
                closed = true;
                closeReason = ErrorCode::SocketClosed;
            }
        }
        cv.notify_all();
        if (connection)
            lib->api->ConnectionShutdown(connection, QUIC_CONNECTION_SHUTDOWN_FLAG_NONE, 0);
    }

private:
    static QUIC_STATUS QUIC_API callback(HQUIC, void* context, QUIC_CONNECTION_EVENT* event)
    {
        return static_cast<MsQuicConnection*>(context)->onEvent(*event);
    }

    QUIC_STATUS onEvent(const QUIC_CONNECTION_EVENT& event)
    {
        switch (event.Type) {
        case QUIC_CONNECTION_EVENT_CONNECTED:
            {
                std::lock_guard lock(mutex);
                connected = true;
            }
            cv.notify_all();
            break;
        case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_TRANSPORT:
            setClosed(makeQuicError(event.SHUTDOWN_INITIATED_BY_TRANSPORT.Status));
            break;
        case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_PEER:
            spdlog::debug("tpuquic: connection closed by peer code={}",
                (std::uint64_t)event.SHUTDOWN_INITIATED_BY_PEER.ErrorCode);
            setClosed(ErrorCode::SocketClosed);
            break;
        case QUIC_CONNECTION_EVENT_SHUTDOWN_COMPLETE:
            setClosed(ErrorCode::SocketClosed);
            break;
        default:
            break;
        }
        return QUIC_STATUS_SUCCESS;
    }

    void setClosed(std::error_code reason)
    {
        {
            std::lock_guard lock(mutex);
            if (closed) return;
            closed = true;
            closeReason = reason;
        }
        cv.notify_all();
    }

    std::shared_ptr<details::MsQuicLibrary> lib;
    HQUIC configuration = nullptr;
    HQUIC connection = nullptr;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    bool connected = false;
    bool closed = false;
    bool shutdownRequested = false;
    std::error_code closeReason;
};

} // namespace

MsQuicDialer::MsQuicDialer(Metrics* metrics, SourceResolver::InterfaceLookup lookup)
    : metrics(metrics)
    , lookup(std::move(lookup))
    , lib(std::make_shared<details::MsQuicLibrary>())
{
    if (!this->lookup) throw std::invalid_argument("interface lookup must not be empty");
}

Maybe<QuicConnectionPtr> MsQuicDialer::dial(const Context& ctx, const std::string& iface,
    const std::string& hostPort, const QuicConfig& config)
{
    auto remote = parseHostPort(hostPort);
    if (isError(remote)) return propagateError(remote);
    if (auto ec = ctx.err(); ec) return Error(ec);

    auto connect = [&] () -> Maybe<QuicConnectionPtr> {
        auto local = lookup(iface);
        if (isError(local)) return propagateError(local);
        auto configuration = openConfiguration(*lib, config);
        if (isError(configuration)) return propagateError(configuration);

        auto conn = std::make_shared<MsQuicConnection>(lib, *configuration);
        auto ec = conn->start(*local, remote->first, remote->second);
        if (!ec) ec = conn->waitConnected(ctx);
        if (ec) {
            conn->close();
            return Error(ec);
        }
        return conn;
    };

    auto conn = connect();
    if (metrics) metrics->quicDial(iface, !isError(conn));
    if (isError(conn)) {
        spdlog::debug("tpuquic: dial failed iface={} addr={} error={}",
            iface, hostPort, fmtError(conn.error()));
    }
    return conn;
}

} // namespace gmon
