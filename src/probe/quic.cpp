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

#include "gmon/probe/quic.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

using namespace std::chrono_literals;


namespace gmon {

// Message quic-go and compatible stacks report when the handshake idle timeout
// fires. Only consulted for errors from foreign categories.
static constexpr std::string_view IDLE_TIMEOUT_MESSAGE = "timeout: no recent network activity";

static bool isIdleTimeout(std::error_code ec)
{
    if (ec == ErrorCode::IdleTimeout) return true;
    if (ec.category() == gmon_error_category()) return false;
    return ec.message().find(IDLE_TIMEOUT_MESSAGE) != std::string::npos;
}

QuicTarget::QuicTarget(std::string iface, std::string hostPort,
    std::shared_ptr<QuicDialer> dialer, QuicTargetConfig config)
    : ifname(std::move(iface))
    , endpoint(std::move(hostPort))
    , targetId(makeQuicTargetId(ifname, endpoint))
    , dialer(std::move(dialer))
    , cfg(std::move(config))
{
    if (ifname.empty()) throw std::invalid_argument("tpuquic target requires an interface");
    if (endpoint.empty()) throw std::invalid_argument("tpuquic target requires an endpoint");
    if (!this->dialer) throw std::invalid_argument("tpuquic target requires a dialer");
}

Maybe<std::pair<QuicConnectionPtr, bool>> QuicTarget::dialIfNeeded(const Context& ctx)
{
    std::lock_guard lock(connMutex);
    if (conn && !conn->isClosed()) {
        return std::make_pair(conn, false);
    }
    if (conn) {
        conn->close();
        conn.reset();
    }
    auto dialed = dialer->dial(ctx, ifname, endpoint, cfg.quic);
    if (isError(dialed)) return propagateError(dialed);
    conn = *dialed;
    return std::make_pair(conn, true);
}

void QuicTarget::close()
{
    std::lock_guard lock(connMutex);
    if (conn) {
        conn->close();
        conn.reset();
    }
}

Maybe<QuicConnectionStats> QuicTarget::waitForReady(const Context& ctx, QuicConnection& c)
{
    using Clock = Context::Clock;
    auto interval = cfg.quic.keepAlivePeriod > 0ns
        ? std::chrono::duration_cast<Clock::duration>(cfg.quic.keepAlivePeriod)
        : Clock::duration(1s);
    auto wait = ctx.remaining().value_or(
        std::chrono::duration_cast<Clock::duration>(cfg.readyWaitFallback));
    auto until = Clock::now() + wait;

    auto stats = c.stats();
    while (quicStatsNotReady(stats)) {
        auto now = Clock::now();
        if (now >= until) break;
        auto ec = ctx.sleepFor(std::min(interval, until - now));
        if (ec == ErrorCondition::Cancelled) return Error(ec);
        stats = c.stats();
        if (ec) break;
    }
    return stats;
}

Maybe<ProbeResult> QuicTarget::probe(const Context& ctx)
{
    if (cfg.preflight) {
        if (auto reason = cfg.preflight(ctx); reason) {
            return ProbeResult::Failure(*reason);
        }
    }
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);

    auto dialed = dialIfNeeded(ctx);
    if (isError(dialed)) {
        auto ec = dialed.error();
        if (ec == ErrorCondition::Cancelled) return Error(ec);
        if (isIdleTimeout(ec) || ec == ErrorCode::DeadlineExceeded || ctx.expired()) {
            return ProbeResult::Failure(FailReason::Timeout, ec);
        }
        spdlog::debug("tpuquic: dial failed target={} error={}", targetId, fmtError(ec));
        return ProbeResult::Failure(FailReason::Other, ec);
    }
    auto [c, fresh] = *dialed;
    if (!c) {
        return ProbeResult::Failure(FailReason::Other, ErrorCode::NilConnection);
    }

    QuicConnectionStats stats;
    if (fresh) {
        auto ready = waitForReady(ctx, *c);
        if (isError(ready)) return propagateError(ready);
        stats = *ready;
    } else {
        stats = c->stats();
    }
    if (quicStatsNotReady(stats)) {
        return ProbeResult::Failure(FailReason::NotReady, ErrorCode::StatsNotReady);
    }

    auto ps = ProbeStats::FromCounters(stats.packetsSent, stats.packetsReceived,
        stats.minRtt, stats.smoothedRtt, stats.meanDeviation);
    if (ps.packetsRecv == 0) {
        return ProbeResult::Failure(FailReason::PacketsLost, ErrorCode::NoPacketsReceived, ps);
    }
    return ProbeResult::Success(ps);
}

} // namespace gmon
