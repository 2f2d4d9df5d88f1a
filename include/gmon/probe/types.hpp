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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>


namespace gmon {

/// \brief Deterministic key of a probe target derived from protocol, source
/// interface and destination address.
using ProbeTargetId = std::string;

enum class ProbeType
{
    ICMP,
    TPUQUIC,
    Unknown,
};

enum class ProbePath
{
    PublicInternet,
    DoubleZero,
};

enum class FailReason
{
    None,
    NoRoute,     ///< preflight routing check failed
    PacketsLost, ///< complete loss, nothing received
    NotReady,    ///< protocol stats have not stabilized
    Timeout,     ///< deadline exceeded during send, dial or readiness wait
    Other,       ///< unclassified protocol or dial error
};

inline const char* toString(ProbeType type)
{
    switch (type) {
    case ProbeType::ICMP:
        return "icmp";
    case ProbeType::TPUQUIC:
        return "tpuquic";
    default:
        return "unknown";
    }
}

inline const char* toString(ProbePath path)
{
    switch (path) {
    case ProbePath::PublicInternet:
        return "public_internet";
    case ProbePath::DoubleZero:
        return "doublezero";
    default:
        return "error";
    }
}

inline const char* toString(FailReason reason)
{
    switch (reason) {
    case FailReason::None:
        return "";
    case FailReason::NoRoute:
        return "no-route";
    case FailReason::PacketsLost:
        return "packets-lost";
    case FailReason::NotReady:
        return "not-ready";
    case FailReason::Timeout:
        return "timeout";
    case FailReason::Other:
        return "other";
    default:
        return "error";
    }
}

inline ProbeTargetId makeIcmpTargetId(std::string_view iface, std::string_view ip)
{
    ProbeTargetId id = "icmp/";
    id.append(iface).append("/").append(ip);
    return id;
}

inline ProbeTargetId makeQuicTargetId(std::string_view iface, std::string_view hostPort)
{
    ProbeTargetId id = "tpuquic/";
    id.append(iface).append("/").append(hostPort);
    return id;
}

/// \brief Divide two numbers, returning zero if the denominator is zero.
inline double safeDiv(double num, double denom)
{
    if (denom == 0.0) return 0.0;
    return num / denom;
}

struct ProbeStats
{
    using Duration = std::chrono::nanoseconds;

    std::uint64_t packetsSent = 0;
    std::uint64_t packetsRecv = 0;
    std::uint64_t packetsLost = 0;
    double lossRatio = 0.0;
    Duration rttMin = Duration::zero();
    Duration rttAvg = Duration::zero();
    Duration rttStdDev = Duration::zero();

    /// \brief Derive loss from the raw packet counters.
    static ProbeStats FromCounters(std::uint64_t sent, std::uint64_t recv,
        Duration min, Duration avg, Duration stdDev)
    {
        ProbeStats stats;
        stats.packetsSent = sent;
        stats.packetsRecv = recv;
        stats.packetsLost = sent > recv ? sent - recv : 0;
        stats.lossRatio = safeDiv((double)stats.packetsLost, (double)sent);
        stats.rttMin = min;
        stats.rttAvg = avg;
        stats.rttStdDev = stdDev;
        return stats;
    }

    bool operator==(const ProbeStats&) const = default;
};

struct ProbeResult
{
    std::chrono::system_clock::time_point timestamp;
    bool ok = false;
    std::optional<ProbeStats> stats;
    FailReason failReason = FailReason::None;
    std::error_code error;

    static ProbeResult Success(ProbeStats stats)
    {
        ProbeResult res;
        res.timestamp = std::chrono::system_clock::now();
        res.ok = true;
        res.stats = stats;
        return res;
    }

    static ProbeResult Failure(FailReason reason, std::error_code ec = {},
        std::optional<ProbeStats> stats = std::nullopt)
    {
        ProbeResult res;
        res.timestamp = std::chrono::system_clock::now();
        res.ok = false;
        res.failReason = reason;
        res.error = ec;
        res.stats = stats;
        return res;
    }
};

} // namespace gmon
