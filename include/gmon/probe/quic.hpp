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

#pragma once

#include "gmon/probe/target.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>


namespace gmon {

/// \brief Connection level statistics as kept by a QUIC loss recovery
/// implementation (RFC 9002).
struct QuicConnectionStats
{
    std::chrono::nanoseconds minRtt{};
    std::chrono::nanoseconds latestRtt{};
    std::chrono::nanoseconds smoothedRtt{};
    std::chrono::nanoseconds meanDeviation{};
    std::uint64_t packetsSent = 0;
    std::uint64_t packetsReceived = 0;
};

/// \brief Statistics are considered untouched defaults until at least one
/// RTT sample was taken.
inline bool quicStatsNotReady(const QuicConnectionStats& stats)
{
    return stats.meanDeviation.count() == 0
        || stats.latestRtt.count() == 0
        || stats.packetsSent == 0;
}

class QuicConnection
{
public:
    virtual ~QuicConnection() = default;
    virtual bool isClosed() const = 0;
    virtual QuicConnectionStats stats() const = 0;
    virtual void close() = 0;
};

using QuicConnectionPtr = std::shared_ptr<QuicConnection>;

struct QuicConfig
{
    std::chrono::nanoseconds keepAlivePeriod = std::chrono::seconds(1);
    std::chrono::nanoseconds maxIdleTimeout = std::chrono::seconds(5);
    std::chrono::nanoseconds handshakeIdleTimeout = std::chrono::seconds(2);
    /// PEM client certificate and key presented during the handshake. No
    /// client certificate is sent if empty.
    std::string certFile;
    std::string keyFile;
};

class QuicDialer
{
public:
    virtual ~QuicDialer() = default;

    /// \brief Establish a connection to `hostPort` from interface `iface`.
    /// May return a null pointer without an error.
    virtual Maybe<QuicConnectionPtr> dial(const Context& ctx, const std::string& iface,
        const std::string& hostPort, const QuicConfig& config) = 0;
};

struct QuicTargetConfig
{
    QuicConfig quic;
    /// Upper bound on the readiness wait if the probe context has no deadline.
    std::chrono::nanoseconds readyWaitFallback = std::chrono::seconds(5);
    Preflight preflight;
};

/// \brief Probes a QUIC endpoint by keeping a connection alive across probes
/// and sampling its RTT statistics.
class QuicTarget : public ProbeTarget
{
public:
    QuicTarget(std::string iface, std::string hostPort,
        std::shared_ptr<QuicDialer> dialer, QuicTargetConfig config = {});

    const ProbeTargetId& id() const override { return targetId; }
    ProbeType type() const override { return ProbeType::TPUQUIC; }
    const std::string& iface() const override { return ifname; }
    std::string addr() const override { return endpoint; }
    const QuicTargetConfig& config() const { return cfg; }

    Maybe<ProbeResult> probe(const Context& ctx) override;
    void close() override;

    /// \brief Return the cached connection or dial a new one if there is none
    /// or the cached one is closed. The second member is true if a dial
    /// happened.
    Maybe<std::pair<QuicConnectionPtr, bool>> dialIfNeeded(const Context& ctx);

private:
    Maybe<QuicConnectionStats> waitForReady(const Context& ctx, QuicConnection& conn);

    std::string ifname;
    std::string endpoint;
    ProbeTargetId targetId;
    std::shared_ptr<QuicDialer> dialer;
    QuicTargetConfig cfg;

    std::mutex connMutex;
    QuicConnectionPtr conn;
};

} // namespace gmon
