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

#include <boost/asio/ip/address_v4.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>


namespace gmon {

struct PingRequest
{
    std::string iface;
    boost::asio::ip::address_v4 address;
    int count = 0;
    std::chrono::nanoseconds interval{};
    std::size_t size = 0;
};

struct PingStats
{
    std::uint64_t packetsSent = 0;
    std::uint64_t packetsRecv = 0;
    std::chrono::nanoseconds rttMin{};
    std::chrono::nanoseconds rttAvg{};
    std::chrono::nanoseconds rttMax{};
    std::chrono::nanoseconds rttStdDev{};
};

/// \brief Sends a burst of ICMP echo requests and collects the replies.
class Pinger
{
public:
    virtual ~Pinger() = default;

    /// \brief Run a burst as described by `req`. Blocks until all replies
    /// arrived, the wait for the last reply elapsed, or `ctx` is done.
    /// \return DeadlineExceeded if the deadline passed before all requests
    /// were sent, Cancelled if `ctx` was cancelled.
    virtual Maybe<PingStats> ping(const Context& ctx, const PingRequest& req) = 0;
};

struct IcmpTargetConfig
{
    static constexpr int DEFAULT_COUNT = 3;
    static constexpr auto DEFAULT_INTERVAL = std::chrono::seconds(1);
    static constexpr std::size_t DEFAULT_SIZE = 24;

    int count = 0;                     ///< echoes per probe, 0 selects the default
    std::chrono::nanoseconds interval{}; ///< spacing, 0 selects the default
    std::size_t size = 0;              ///< payload bytes, 0 selects the default
    Preflight preflight;
};

class IcmpTarget : public ProbeTarget
{
public:
    IcmpTarget(std::string iface, boost::asio::ip::address_v4 ip,
        std::shared_ptr<Pinger> pinger, IcmpTargetConfig config = {});

    const ProbeTargetId& id() const override { return targetId; }
    ProbeType type() const override { return ProbeType::ICMP; }
    const std::string& iface() const override { return ifname; }
    std::string addr() const override { return address.to_string(); }
    boost::asio::ip::address_v4 ip() const { return address; }
    const IcmpTargetConfig& config() const { return cfg; }

    Maybe<ProbeResult> probe(const Context& ctx) override;
    void close() override {}

private:
    std::string ifname;
    boost::asio::ip::address_v4 address;
    ProbeTargetId targetId;
    std::shared_ptr<Pinger> pinger;
    IcmpTargetConfig cfg;
};

} // namespace gmon
