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

#include "gmon/probe/asio_pinger.hpp"

#include <utility>

#include <boost/asio.hpp>

#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <functional>
#include <random>
#include <vector>

namespace asio = boost::asio;
using namespace std::chrono_literals;
using std::uint8_t;
using std::uint16_t;


namespace gmon {

// Upper bound on a single blocking wait so that cancellation is noticed.
static constexpr auto POLL_INTERVAL = 50ms;

static uint16_t checksum(const uint8_t* data, std::size_t len)
{
    std::uint32_t sum = 0;
    for (; len > 1; len -= 2, data += 2) {
        sum += (std::uint32_t)((data[0] << 8) | data[1]);
    }
    if (len == 1) sum += (std::uint32_t)(data[0] << 8);
    sum = (sum >> 16) + (sum & 0xffff);
    sum += (sum >> 16);
    return (uint16_t)~sum;
}

static std::vector<uint8_t> makeEchoRequest(uint16_t ident, uint16_t seq, std::size_t size)
{
    std::vector<uint8_t> pkt(sizeof(icmphdr) + size);
    pkt[0] = ICMP_ECHO;
    pkt[1] = 0;
    pkt[4] = (uint8_t)(ident >> 8);
    pkt[5] = (uint8_t)(ident & 0xff);
    pkt[6] = (uint8_t)(seq >> 8);
    pkt[7] = (uint8_t)(seq & 0xff);
    for (std::size_t i = 0; i < size; ++i) {
        pkt[sizeof(icmphdr) + i] = (uint8_t)(i & 0xff);
    }
    auto csum = checksum(pkt.data(), pkt.size());
    pkt[2] = (uint8_t)(csum >> 8);
    pkt[3] = (uint8_t)(csum & 0xff);
    return pkt;
}

static std::error_code toStd(const boost::system::error_code& ec)
{
    return std::error_code(ec.value(), std::system_category());
}

namespace {

struct Burst
{
    uint16_t ident = 0;
    asio::ip::address_v4 dst;
    std::vector<Context::Clock::time_point> sentAt;
    std::vector<bool> answered;
    std::vector<std::chrono::nanoseconds> rtts;

    void onReply(const uint8_t* data, std::size_t len, const asio::ip::address_v4& from)
    {
        if (from != dst) return;
        if (len < sizeof(iphdr)) return;
        std::size_t ihl = (data[0] & 0x0f) * 4;
        if (len < ihl + sizeof(icmphdr)) return;
        const uint8_t* icmp = data + ihl;
        if (icmp[0] != ICMP_ECHOREPLY) return;
        uint16_t id = (uint16_t)((icmp[4] << 8) | icmp[5]);
        uint16_t seq = (uint16_t)((icmp[6] << 8) | icmp[7]);
        if (id != ident || seq >= sentAt.size() || answered[seq]) return;
        answered[seq] = true;
        rtts.push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(
            Context::Clock::now() - sentAt[seq]));
    }
};

} // namespace

Maybe<PingStats> AsioPinger::ping(const Context& ctx, const PingRequest& req)
{
    using Clock = Context::Clock;
    if (req.count <= 0) return Error(ErrorCode::InvalidArgument);

    asio::io_context ioCtx(1);
    asio::ip::icmp::socket socket(ioCtx);
    boost::system::error_code ec;
    socket.open(asio::ip::icmp::v4(), ec);
    if (ec) return Error(toStd(ec));
    if (setsockopt(socket.native_handle(), SOL_SOCKET, SO_BINDTODEVICE,
        req.iface.c_str(), (socklen_t)req.iface.size()) < 0) {
        return Error(std::error_code(errno, std::system_category()));
    }

    static thread_local std::mt19937 rng(std::random_device{}());
    Burst burst;
    burst.ident = (uint16_t)std::uniform_int_distribution<int>(0, 0xffff)(rng);
    burst.dst = req.address;
    burst.sentAt.resize(req.count);
    burst.answered.resize(req.count, false);

    std::array<uint8_t, 2048> buffer;
    asio::ip::icmp::endpoint from;
    std::function<void()> receive = [&] {
        socket.async_receive_from(asio::buffer(buffer), from,
            [&] (const boost::system::error_code& ec, std::size_t n) {
                if (ec) return;
                if (from.address().is_v4())
                    burst.onReply(buffer.data(), n, from.address().to_v4());
                receive();
            });
    };
    receive();

    asio::ip::icmp::endpoint dst(req.address, 0);
    for (int seq = 0; seq < req.count; ++seq) {
        if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
        if (ctx.expired()) return Error(ErrorCode::DeadlineExceeded);

        auto pkt = makeEchoRequest(burst.ident, (uint16_t)seq, req.size);
        burst.sentAt[seq] = Clock::now();
        socket.send_to(asio::buffer(pkt), dst, 0, ec);
        if (ec) return Error(toStd(ec));

        // After the last request the interval is the wait for outstanding replies.
        bool last = (seq + 1 == req.count);
        auto next = Clock::now() + std::chrono::duration_cast<Clock::duration>(req.interval);
        while (Clock::now() < next) {
            if (last && burst.rtts.size() == (std::size_t)req.count) break;
            if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
            if (ctx.expired()) {
                if (!last) return Error(ErrorCode::DeadlineExceeded);
                break;
            }
            auto until = std::min(next, Clock::now() + POLL_INTERVAL);
            if (auto deadline = ctx.deadline(); deadline) until = std::min(until, *deadline);
            ioCtx.run_one_until(until);
            if (ioCtx.stopped()) ioCtx.restart();
        }
    }
    socket.close(ec);

    PingStats stats;
    stats.packetsSent = (std::uint64_t)req.count;
    stats.packetsRecv = burst.rtts.size();
    if (!burst.rtts.empty()) {
        auto [min, max] = std::minmax_element(burst.rtts.begin(), burst.rtts.end());
        stats.rttMin = *min;
        stats.rttMax = *max;
        double sum = 0.0;
        for (auto rtt : burst.rtts) sum += (double)rtt.count();
        double avg = sum / (double)burst.rtts.size();
        double var = 0.0;
        for (auto rtt : burst.rtts) var += std::pow((double)rtt.count() - avg, 2.0);
        var /= (double)burst.rtts.size();
        stats.rttAvg = std::chrono::nanoseconds((std::int64_t)avg);
        stats.rttStdDev = std::chrono::nanoseconds((std::int64_t)std::sqrt(var));
    }
    return stats;
}

} // namespace gmon
