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

#include <string>
#include <system_error>
#include <thread>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;


namespace {

gmon::QuicTargetConfig fastConfig()
{
    gmon::QuicTargetConfig cfg;
    cfg.quic.keepAlivePeriod = 5ms;
    cfg.readyWaitFallback = 50ms;
    return cfg;
}

/// Errors of a third party stack that only identifies idle timeouts by text.
struct ForeignQuicCategory : public std::error_category
{
    const char* name() const noexcept override { return "foreign-quic"; }

    std::string message(int code) const override
    {
        if (code == 1) return "timeout: no recent network activity";
        return "handshake failed";
    }
};

const std::error_category& foreignQuicCategory()
{
    static const ForeignQuicCategory category;
    return category;
}

} // namespace

TEST(QuicTarget, Construct)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    QuicTarget target("eth0", "192.0.2.1:8009", dialer);
    EXPECT_EQ(target.id(), "tpuquic/eth0/192.0.2.1:8009");
    EXPECT_EQ(target.type(), ProbeType::TPUQUIC);
    EXPECT_EQ(target.addr(), "192.0.2.1:8009");

    EXPECT_THROW(QuicTarget("eth0", "", dialer), std::invalid_argument);
    EXPECT_THROW(QuicTarget("eth0", "192.0.2.1:8009", nullptr), std::invalid_argument);
}

TEST(QuicTarget, ReadyConnection)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    EXPECT_CALL(*dialer, dial(_, "eth0", "192.0.2.1:8009", _)).WillOnce(Return(conn));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->ok);
    EXPECT_EQ(res->stats->rttMin, 10ms);
    EXPECT_EQ(res->stats->rttAvg, 11ms);
    EXPECT_EQ(res->stats->rttStdDev, 1ms);
    EXPECT_EQ(res->stats->packetsLost, 0);

    // The connection is reused
    auto again = target.probe(Context());
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->ok);
}

TEST(QuicTarget, WaitsForStatsAfterDial)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    conn->readyAfter = 3;
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(conn));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto res = target.probe(Context().withTimeout(1s));
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->ok);
    EXPECT_GE(conn->statsCalls, 3);
}

TEST(QuicTarget, NotReadyAfterFallbackWait)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>();
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(conn));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto start = std::chrono::steady_clock::now();
    auto res = target.probe(Context());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::NotReady);
    EXPECT_EQ(res->error, ErrorCode::StatsNotReady);
}

TEST(QuicTarget, NotReadyAtContextDeadline)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>();
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(conn));

    // The remaining deadline bounds the wait, not the fallback
    auto cfg = fastConfig();
    cfg.readyWaitFallback = 10s;
    QuicTarget target("eth0", "192.0.2.1:8009", dialer, cfg);
    auto start = std::chrono::steady_clock::now();
    auto res = target.probe(Context().withTimeout(30ms));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::NotReady);
    EXPECT_GE(elapsed, 25ms);
    EXPECT_LT(elapsed, 1s);
}

TEST(QuicTarget, NotReadyOnReusedConnection)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(conn));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    ASSERT_TRUE(target.probe(Context())->ok);

    conn->setStats(QuicConnectionStats{});
    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::NotReady);
}

TEST(QuicTarget, RedialAfterRemoteClose)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto first = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    auto second = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    EXPECT_CALL(*dialer, dial(_, _, _, _))
        .WillOnce(Return(first))
        .WillOnce(::testing::Invoke([&] (auto&&...) -> Maybe<QuicConnectionPtr> {
            // The stale connection is closed before dialing again
            EXPECT_EQ(first->closeCalls, 1);
            return second;
        }));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    ASSERT_TRUE(target.probe(Context())->ok);

    first->closed = true;
    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->ok);

    auto dialed = target.dialIfNeeded(Context());
    ASSERT_TRUE(dialed.has_value());
    EXPECT_EQ(dialed->first, second);
    EXPECT_FALSE(dialed->second);
}

TEST(QuicTarget, CloseReleasesConnection)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto first = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    auto second = std::make_shared<test::FakeQuicConnection>(test::readyQuicStats());
    EXPECT_CALL(*dialer, dial(_, _, _, _))
        .WillOnce(Return(first))
        .WillOnce(Return(second));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    ASSERT_TRUE(target.probe(Context())->ok);
    target.close();
    EXPECT_EQ(first->closeCalls, 1);
    target.close();
    EXPECT_EQ(first->closeCalls, 1);

    // Probing after close dials again
    ASSERT_TRUE(target.probe(Context())->ok);
}

TEST(QuicTarget, NilConnection)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(QuicConnectionPtr()));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::Other);
    EXPECT_EQ(res->error, ErrorCode::NilConnection);
}

TEST(QuicTarget, DialTimeouts)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    EXPECT_CALL(*dialer, dial(_, _, _, _))
        .WillOnce(Return(Error(ErrorCode::IdleTimeout)))
        .WillOnce(Return(Error(ErrorCode::DeadlineExceeded)))
        .WillOnce(Return(Error(std::make_error_code(std::errc::connection_refused))));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto idle = target.probe(Context());
    ASSERT_TRUE(idle.has_value());
    EXPECT_EQ(idle->failReason, FailReason::Timeout);

    auto deadline = target.probe(Context());
    ASSERT_TRUE(deadline.has_value());
    EXPECT_EQ(deadline->failReason, FailReason::Timeout);

    auto refused = target.probe(Context());
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(refused->failReason, FailReason::Other);
}

TEST(QuicTarget, ForeignIdleTimeoutByMessage)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    EXPECT_CALL(*dialer, dial(_, _, _, _))
        .WillOnce(Return(Error(std::error_code(1, foreignQuicCategory()))))
        .WillOnce(Return(Error(std::error_code(2, foreignQuicCategory()))));

    QuicTarget target("eth0", "192.0.2.1:8009", dialer, fastConfig());
    auto idle = target.probe(Context());
    ASSERT_TRUE(idle.has_value());
    EXPECT_EQ(idle->failReason, FailReason::Timeout);
    EXPECT_EQ(idle->error.category().name(), std::string("foreign-quic"));

    auto other = target.probe(Context());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->failReason, FailReason::Other);
}

TEST(QuicTarget, PreflightSkipsDial)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    EXPECT_CALL(*dialer, dial(_, _, _, _)).Times(0);

    auto cfg = fastConfig();
    cfg.preflight = [] (const Context&) -> std::optional<FailReason> {
        return FailReason::NoRoute;
    };
    QuicTarget target("doublezero0", "198.51.100.7:8009", dialer, cfg);
    auto res = target.probe(Context());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->failReason, FailReason::NoRoute);
}

TEST(QuicTarget, CancelledWhileWaiting)
{
    using namespace gmon;
    auto dialer = std::make_shared<test::MockQuicDialer>();
    auto conn = std::make_shared<test::FakeQuicConnection>();
    EXPECT_CALL(*dialer, dial(_, _, _, _)).WillOnce(Return(conn));

    std::stop_source stop;
    auto cfg = fastConfig();
    cfg.readyWaitFallback = 10s;
    QuicTarget target("eth0", "192.0.2.1:8009", dialer, cfg);
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });
    auto res = target.probe(Context(stop.get_token()));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), ErrorCondition::Cancelled);
}
