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

#include "gmon/probe/icmp.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>


namespace gmon {

IcmpTarget::IcmpTarget(std::string iface, boost::asio::ip::address_v4 ip,
    std::shared_ptr<Pinger> pinger, IcmpTargetConfig config)
    : ifname(std::move(iface))
    , address(ip)
    , targetId(makeIcmpTargetId(ifname, address.to_string()))
    , pinger(std::move(pinger))
    , cfg(std::move(config))
{
    if (ifname.empty()) throw std::invalid_argument("icmp target requires an interface");
    if (!this->pinger) throw std::invalid_argument("icmp target requires a pinger");
    if (cfg.count <= 0) cfg.count = IcmpTargetConfig::DEFAULT_COUNT;
    if (cfg.interval <= std::chrono::nanoseconds::zero())
        cfg.interval = IcmpTargetConfig::DEFAULT_INTERVAL;
    if (cfg.size == 0) cfg.size = IcmpTargetConfig::DEFAULT_SIZE;
}

Maybe<ProbeResult> IcmpTarget::probe(const Context& ctx)
{
    if (cfg.preflight) {
        if (auto reason = cfg.preflight(ctx); reason) {
            return ProbeResult::Failure(*reason);
        }
    }
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);

    PingRequest req = {
        .iface = ifname,
        .address = address,
        .count = cfg.count,
        .interval = cfg.interval,
        .size = cfg.size,
    };
    auto stats = pinger->ping(ctx, req);
    if (isError(stats)) {
        auto ec = stats.error();
        if (ec == ErrorCondition::Cancelled) return Error(ec);
        if (ec == ErrorCondition::Timeout) {
            return ProbeResult::Failure(FailReason::Timeout, ec);
        }
        spdlog::debug("icmp: probe error target={} error={}", targetId, fmtError(ec));
        return ProbeResult::Failure(FailReason::Other, ec);
    }

    // Counters that still look like defaults did not settle yet.
    if (stats->packetsSent == 0 || (stats->packetsRecv > 0 && stats->rttAvg.count() == 0)) {
        return ProbeResult::Failure(FailReason::NotReady, ErrorCode::StatsNotReady);
    }

    auto ps = ProbeStats::FromCounters(stats->packetsSent, stats->packetsRecv,
        stats->rttMin, stats->rttAvg, stats->rttStdDev);
    if (ps.packetsRecv == 0) {
        return ProbeResult::Failure(FailReason::PacketsLost, ErrorCode::NoPacketsReceived, ps);
    }
    return ProbeResult::Success(ps);
}

} // namespace gmon
