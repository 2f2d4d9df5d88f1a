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

#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::Invoke;


namespace {

gmon::PingStats pingStats(std::uint64_t sent, std::uint64_t recv)
{
    gmon::PingStats stats;
    stats.packetsSent = sent;
    stats.packetsRecv = recv;
    if (recv > 0) {
        stats.rttMin = 9ms;
        stats.rttAvg = 10ms;
        stats.rttMax = 11ms;
        stats.rttStdDev = 1ms;
    }
    return stats;
}

} // namespace

TEST(IcmpTarget, Construct)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    auto ip = boost::asio::ip::make_address_v4("192.0.2.1");
    IcmpTarget target("eth0", ip, pinger);
    EXPECT_EQ(target.id(), "icmp/eth0/192.0.2.1");
    EXPECT_EQ(target.addr(), "192.0.2.1");
    EXPECT_EQ(target.type(), ProbeType::ICMP);
    EXPECT_EQ(target.config().count, IcmpTargetConfig::DEFAULT_COUNT);
    EXPECT_EQ(target.config().size, IcmpTargetConfig::DEFAULT_SIZE);

    EXPECT_THROW(IcmpTarget("", ip, pinger), std::invalid_argument);
    EXPECT_THROW(IcmpTarget("eth0", ip, nullptr), std::invalid_argument);
}

TEST(IcmpTarget, Success)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger,
        IcmpTargetConfig{.count = 5, .interval = 100ms, .size = 56});

    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Invoke(
        [] (const Context&, const PingRequest& req) -> Maybe<PingStats> {
            EXPECT_EQ(req.iface, "eth0");
            EXPECT_EQ(req.address.to_string(), "192.0.2.1");
            EXPECT_EQ(req.count, 5);
            EXPECT_EQ(req.interval, 100ms);
            EXPECT_EQ(req.size, 56);
            return pingStats(5, 4);
        }));

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->ok);
    ASSERT_TRUE(res->stats.has_value());
    EXPECT_EQ(res->stats->packetsLost, 1);
    EXPECT_DOUBLE_EQ(res->stats->lossRatio, 0.2);
    EXPECT_EQ(res->stats->rttAvg, 10ms);
}

TEST(IcmpTarget, AllPacketsLost)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(pingStats(3, 0)));

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->ok);
    EXPECT_EQ(res->failReason, FailReason::PacketsLost);
    EXPECT_EQ(res->error, ErrorCode::NoPacketsReceived);
    ASSERT_TRUE(res->stats.has_value());
    EXPECT_EQ(res->stats->lossRatio, 1.0);
}

TEST(IcmpTarget, StatsNotSettled)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(PingStats{}));

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::NotReady);
}

TEST(IcmpTarget, DeadlineDuringSend)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(Error(ErrorCode::DeadlineExceeded)));

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::Timeout);
}

TEST(IcmpTarget, OtherError)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(Error(ErrorCode::InterfaceNotFound)));

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::Other);
    EXPECT_EQ(res->error, ErrorCode::InterfaceNotFound);
}

TEST(IcmpTarget, CancelledIsError)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTarget target("eth0", boost::asio::ip::make_address_v4("192.0.2.1"), pinger);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(Error(ErrorCode::Cancelled)));

    auto res = target.probe(Context());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), ErrorCondition::Cancelled);
}

TEST(IcmpTarget, PreflightNoRoute)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    IcmpTargetConfig cfg;
    cfg.preflight = [] (const Context&) -> std::optional<FailReason> {
        return FailReason::NoRoute;
    };
    IcmpTarget target("doublezero0", boost::asio::ip::make_address_v4("198.51.100.7"),
        pinger, cfg);
    EXPECT_CALL(*pinger, ping(_, _)).Times(0);

    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->ok);
    EXPECT_EQ(res->failReason, FailReason::NoRoute);
    EXPECT_FALSE(res->stats.has_value());
}

TEST(IcmpTarget, RouteAppearsBetweenProbes)
{
    using namespace gmon;
    auto pinger = std::make_shared<test::MockPinger>();
    auto routes = std::make_shared<RouteTable>();
    IcmpTargetConfig cfg;
    cfg.preflight = [routes] (const Context&) -> std::optional<FailReason> {
        if (!routes->contains("198.51.100.7")) return FailReason::NoRoute;
        return std::nullopt;
    };
    IcmpTarget target("doublezero0", boost::asio::ip::make_address_v4("198.51.100.7"),
        pinger, cfg);
    EXPECT_CALL(*pinger, ping(_, _)).WillOnce(Return(pingStats(3, 3)));

    auto first = target.probe(Context());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->failReason, FailReason::NoRoute);

    routes->update(RouteMap{{"198.51.100.7", Route{}}});
    auto second = target.probe(Context());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->ok);
}
