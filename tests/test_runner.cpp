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

#include "gmon/planner/dz_user_icmp.hpp"
#include "gmon/planner/sol_val_icmp.hpp"
#include "gmon/runner.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace gmon;
using namespace std::chrono_literals;
using boost::asio::ip::make_address_v4;
using ::testing::_;
using ::testing::Return;


namespace {

class FailingPlanner : public Planner
{
public:
    PlanKind kind() const override { return PlanKind::SolValTpuQuic; }
    Maybe<PlanSet> buildPlans(const PlanInputs&) const override
    {
        return Error(ErrorCode::InvalidArgument);
    }
    void record(const ProbePlan&, const ProbeResult&, const PlanInputs&, PointSink*) const override
    {}
};

class RunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        PingStats stats;
        stats.packetsSent = 3;
        stats.packetsRecv = 3;
        stats.rttMin = 9ms;
        stats.rttAvg = 10ms;
        stats.rttMax = 11ms;
        stats.rttStdDev = 1ms;
        ON_CALL(*pinger, ping(_, _)).WillByDefault(Return(stats));

        SolanaSnapshot snap;
        for (std::uint8_t b : {0xa1, 0xa2}) {
            GossipNode node{
                .pubkey = test::key(b),
                .gossipIp = make_address_v4(b == 0xa1 ? "192.0.2.10" : "10.0.0.3"),
            };
            snap.gossipNodes[node.pubkey] = node;
            snap.validators[node.pubkey] = Validator{.node = node};
        }
        solana->snapshot = snap;

        serviceability->data = ProgramData::Build({}, {}, {
            User{.pubkey = test::key(0x01), .clientIp = make_address_v4("203.0.113.100"),
                .dzIp = make_address_v4("203.0.113.1")},
            User{.pubkey = test::key(0x02), .clientIp = make_address_v4("198.51.100.2"),
                .dzIp = make_address_v4("10.0.0.3"), .validatorPk = test::key(0xa2)},
        });

        OverlayStatus up;
        up.tunnelName = "doublezero0";
        up.sessionStatus = std::string(OverlayStatus::SESSION_UP);
        up.doubleZeroIp = "203.0.113.1";
        status->entries = std::vector<OverlayStatus>{up};

        routes->routes = RouteMap{{"10.0.0.3", Route{}}};
    }

    RunnerConfig config(bool overlay = false)
    {
        SourceConfig sourceCfg{.host = "probe-1", .metro = "ams", .publicIface = "eth0"};
        if (overlay) sourceCfg.dzIface = "doublezero0";
        auto lookup = [] (const std::string& iface) -> Maybe<boost::asio::ip::address_v4> {
            if (iface == "eth0") return make_address_v4("203.0.113.100");
            return Error(ErrorCode::InterfaceNotFound);
        };
        return RunnerConfig{
            .solana = solana,
            .serviceability = serviceability,
            .routes = routes,
            .source = std::make_shared<SourceResolver>(sourceCfg, status, lookup),
            .planners = {
                std::make_shared<SolValIcmpPlanner>(pinger),
                std::make_shared<DzUserIcmpPlanner>(pinger),
            },
            .sink = sink,
            .clock = clock,
            .metrics = metrics,
            .probeInterval = 1h,
            .probeTimeout = 2s,
            .maxConcurrency = 4,
        };
    }

    double ticks(const std::string& outcome)
    {
        return metrics->tickTotal.Add({{"outcome", outcome}}).Value();
    }

    std::shared_ptr<test::FakeSolanaView> solana = std::make_shared<test::FakeSolanaView>();
    std::shared_ptr<test::FakeServiceabilityView> serviceability
        = std::make_shared<test::FakeServiceabilityView>();
    std::shared_ptr<test::FakeRouteSource> routes = std::make_shared<test::FakeRouteSource>();
    std::shared_ptr<test::FakeStatusSource> status = std::make_shared<test::FakeStatusSource>();
    std::shared_ptr<::testing::NiceMock<test::MockPinger>> pinger
        = std::make_shared<::testing::NiceMock<test::MockPinger>>();
    std::shared_ptr<test::MemorySink> sink = std::make_shared<test::MemorySink>();
    std::shared_ptr<FakeClock> clock
        = std::make_shared<FakeClock>(std::chrono::system_clock::time_point(1700000000s));
    std::shared_ptr<Metrics> metrics = std::make_shared<Metrics>();
};

} // namespace

TEST_F(RunnerTest, InvalidConfig)
{
    auto cfg = config();
    cfg.solana.reset();
    EXPECT_THROW(Runner{cfg}, std::invalid_argument);

    cfg = config();
    cfg.planners.clear();
    EXPECT_THROW(Runner{cfg}, std::invalid_argument);

    cfg = config(true);
    cfg.routes.reset();
    EXPECT_THROW(Runner{cfg}, std::invalid_argument);

    cfg = config();
    cfg.probeInterval = 0s;
    EXPECT_THROW(Runner{cfg}, std::invalid_argument);
}

TEST_F(RunnerTest, PublicTick)
{
    Runner runner(config());
    EXPECT_EQ(runner.tick(Context()), "ok");
    EXPECT_EQ(ticks("ok"), 1.0);

    // two validators and two user client addresses
    EXPECT_EQ(runner.targets().len(), 4);
    EXPECT_EQ(sink->points.size(), 4);
    EXPECT_EQ(sink->flushes, 1);
    EXPECT_EQ(routes->calls, 0);
    for (const auto& point : sink->points) {
        EXPECT_EQ(point.timestamp, clock->now());
        EXPECT_EQ(point.tags.at("probe_path"), "public_internet");
    }
    EXPECT_EQ(metrics->planProbesSuccessTotal.Add({
        {"kind", "sol_val_icmp"}, {"path", "public_internet"}, {"probe_type", "icmp"},
    }).Value(), 2.0);
    EXPECT_EQ(metrics->targetsCurrent.Add({}).Value(), 4.0);
}

TEST_F(RunnerTest, TargetsSurviveTicks)
{
    Runner runner(config());
    ASSERT_EQ(runner.tick(Context()), "ok");
    auto before = runner.targets().targets();

    // 0xa2 leaves gossip
    solana->snapshot->validators.erase(test::key(0xa2));
    solana->snapshot->gossipNodes.erase(test::key(0xa2));
    ASSERT_EQ(runner.tick(Context()), "ok");
    auto after = runner.targets().targets();

    EXPECT_EQ(after.size(), 3);
    EXPECT_FALSE(after.contains("icmp/eth0/10.0.0.3"));
    EXPECT_EQ(after.at("icmp/eth0/192.0.2.10"), before.at("icmp/eth0/192.0.2.10"));
    EXPECT_EQ(metrics->targetsPrunedTotal.Add({}).Value(), 1.0);
}

TEST_F(RunnerTest, OverlayTick)
{
    Runner runner(config(true));
    EXPECT_EQ(runner.tick(Context()), "ok");
    EXPECT_EQ(routes->calls, 1);

    auto targets = runner.targets().targets();
    EXPECT_TRUE(targets.contains("icmp/doublezero0/10.0.0.3"));
    std::size_t overlayPoints = 0;
    for (const auto& point : sink->points) {
        if (point.tags.at("probe_path") == "doublezero") ++overlayPoints;
    }
    // Validator 0xa2 and user 0x02 share the 10.0.0.3 target. The own
    // overlay address has no route but is still recorded as a failure.
    EXPECT_EQ(overlayPoints, 3);
    EXPECT_EQ(metrics->planProbesFailTotal.Add({
        {"kind", "dz_user_icmp"}, {"path", "doublezero"},
        {"probe_type", "icmp"}, {"reason", "no-route"},
    }).Value(), 1.0);
}

TEST_F(RunnerTest, AbortLabels)
{
    {
        Runner runner(config());
        solana->snapshot = Error(ErrorCode::InvalidJson);
        EXPECT_EQ(runner.tick(Context()), "solana_err");
        EXPECT_EQ(ticks("solana_err"), 1.0);
        SetUp();
    }
    {
        Runner runner(config());
        serviceability->data = Error(ErrorCode::FileNotFound);
        EXPECT_EQ(runner.tick(Context()), "dz_svc_err");
        SetUp();
    }
    {
        Runner runner(config(true));
        status->entries = std::vector<OverlayStatus>{};
        EXPECT_EQ(runner.tick(Context()), "source_err");
        SetUp();
    }
    {
        Runner runner(config(true));
        routes->routes = Error(ErrorCode::SocketClosed);
        EXPECT_EQ(runner.tick(Context()), "routes_err");
        SetUp();
    }
    {
        auto cfg = config();
        cfg.planners.push_back(std::make_shared<FailingPlanner>());
        Runner runner(cfg);
        EXPECT_EQ(runner.tick(Context()), "sol_val_tpuquic_plans_err");
        EXPECT_EQ(runner.targets().len(), 0);
    }
    EXPECT_TRUE(sink->points.empty());
}

TEST_F(RunnerTest, CancelledTick)
{
    Runner runner(config());
    std::stop_source stop;
    stop.request_stop();
    EXPECT_EQ(runner.tick(Context(stop.get_token())), "cancelled");
    EXPECT_EQ(ticks("probes_err"), 0.0);
    EXPECT_TRUE(sink->points.empty());
}

TEST_F(RunnerTest, WithoutSink)
{
    auto cfg = config();
    cfg.sink.reset();
    Runner runner(cfg);
    EXPECT_EQ(runner.tick(Context()), "ok");
    EXPECT_TRUE(sink->points.empty());
}

TEST_F(RunnerTest, RunAndStop)
{
    Runner runner(config());
    runner.run();
    for (int i = 0; i < 500 && ticks("ok") < 1.0; ++i)
        std::this_thread::sleep_for(10ms);
    EXPECT_EQ(ticks("ok"), 1.0);

    runner.stop();
    runner.join();
    EXPECT_EQ(runner.targets().len(), 0);
    EXPECT_EQ(metrics->targetsCurrent.Add({}).Value(), 0.0);
}
