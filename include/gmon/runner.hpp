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

#include "gmon/clock.hpp"
#include "gmon/context.hpp"
#include "gmon/metrics.hpp"
#include "gmon/planner/plan.hpp"
#include "gmon/routes.hpp"
#include "gmon/serviceability.hpp"
#include "gmon/sink.hpp"
#include "gmon/solana.hpp"
#include "gmon/source.hpp"
#include "gmon/target_set.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>


namespace gmon {

struct RunnerConfig
{
    std::shared_ptr<SolanaView> solana;
    std::shared_ptr<ServiceabilityView> serviceability;
    std::shared_ptr<RouteSource> routes;  ///< required with an overlay interface
    std::shared_ptr<SourceResolver> source;
    std::vector<std::shared_ptr<const Planner>> planners;
    std::shared_ptr<PointSink> sink;      ///< optional
    std::shared_ptr<const Clock> clock;
    std::shared_ptr<Metrics> metrics;     ///< optional

    std::chrono::nanoseconds probeInterval = std::chrono::seconds(60);
    std::chrono::nanoseconds probeTimeout = std::chrono::seconds(8);
    std::size_t maxConcurrency = 128;

    /// \brief Throws std::invalid_argument describing the first problem found.
    void validate() const;
};

/// \brief Drives the probe cycle.
///
/// A tick gathers the current domain state, builds the plans of all
/// planners, updates the target registry, probes all targets and records the
/// results. Ticks run back to back on a fixed cadence on a dedicated thread.
/// Missed fire times are skipped. Stopping cancels in-flight probes and closes
/// all targets.
class Runner
{
public:
    explicit Runner(RunnerConfig config);
    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    ~Runner();

    /// \brief Start the tick loop on a background thread. The first tick runs
    /// immediately.
    void run();
    /// \brief Request the tick loop to stop. Returns immediately.
    void stop();
    /// \brief Wait for the tick loop to finish.
    void join();

    /// \brief Run a single tick.
    /// \return "ok" or the label of the step that failed.
    std::string tick(const Context& ctx);

    const TargetSet& targets() const { return targetSet; }
    const RunnerConfig& config() const { return cfg; }

private:
    boost::asio::awaitable<void> loop();
    void logStart();
    std::string finish(std::string outcome, std::chrono::steady_clock::time_point start);

    RunnerConfig cfg;
    std::shared_ptr<RouteTable> routeTable;
    TargetSet targetSet;

    boost::asio::io_context ioCtx;
    boost::asio::steady_timer timer;
    std::stop_source stopSource;
    std::thread thread;
};

} // namespace gmon
