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

#include "gmon/runner.hpp"
#include "gmon/summary.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <pthread.h>

#include <stdexcept>
#include <utility>


namespace gmon {

static double toSeconds(std::chrono::nanoseconds d)
{
    return std::chrono::duration<double>(d).count();
}

//////////////////
// RunnerConfig //
//////////////////

void RunnerConfig::validate() const
{
    if (probeInterval <= std::chrono::nanoseconds::zero())
        throw std::invalid_argument("probe interval must be positive");
    if (probeTimeout <= std::chrono::nanoseconds::zero())
        throw std::invalid_argument("probe timeout must be positive");
    if (maxConcurrency == 0)
        throw std::invalid_argument("max concurrency must be positive");
    if (!solana) throw std::invalid_argument("solana view is required");
    if (!serviceability) throw std::invalid_argument("serviceability view is required");
    if (!source) throw std::invalid_argument("source resolver is required");
    if (!clock) throw std::invalid_argument("clock is required");
    if (planners.empty()) throw std::invalid_argument("at least one planner is required");
    for (const auto& planner : planners) {
        if (!planner) throw std::invalid_argument("planner must not be null");
    }
    source->config().validate();
    if (!source->config().dzIface.empty() && !routes)
        throw std::invalid_argument("route source is required with a doublezero interface");
}

////////////
// Runner //
////////////

static RunnerConfig validated(RunnerConfig config)
{
    config.validate();
    return config;
}

Runner::Runner(RunnerConfig config)
    : cfg(validated(std::move(config)))
    , routeTable(std::make_shared<RouteTable>())
    , targetSet(TargetSetConfig{
        .maxConcurrency = cfg.maxConcurrency,
        .probeTimeout = cfg.probeTimeout,
    }, cfg.clock, cfg.metrics.get())
    , timer(ioCtx)
{}

Runner::~Runner()
{
    stop();
    join();
    targetSet.prune({});
}

void Runner::run()
{
    if (thread.joinable()) throw std::logic_error("runner is already running");
    logStart();
    boost::asio::co_spawn(ioCtx, loop(), boost::asio::detached);
    thread = std::thread([this] {
        ioCtx.run();
    });
    pthread_setname_np(thread.native_handle(), "runner");
}

void Runner::stop()
{
    stopSource.request_stop();
    boost::asio::post(ioCtx, [this] {
        timer.cancel();
    });
}

void Runner::join()
{
    if (thread.joinable()) thread.join();
}

void Runner::logStart()
{
    const auto& src = cfg.source->config();
    spdlog::info("runner: starting interval={}s timeout={}s max_concurrency={}"
        " public_iface={} dz_iface={} metro={} planners={}",
        toSeconds(cfg.probeInterval), toSeconds(cfg.probeTimeout), cfg.maxConcurrency,
        src.publicIface, src.dzIface.empty() ? "-" : src.dzIface, src.metro,
        cfg.planners.size());
    if (!cfg.sink)
        spdlog::warn("runner: no sink configured, measurements are not recorded");
    if (src.dzIface.empty())
        spdlog::warn("runner: no doublezero interface configured, probing public internet only");

    Context ctx(stopSource.get_token());
    auto programData = cfg.serviceability->getProgramData(ctx);
    if (isError(programData)) {
        spdlog::warn("runner: can't resolve source at startup: {}", fmtError(programData.error()));
        return;
    }
    auto source = cfg.source->resolve(ctx, *programData);
    if (isError(source)) {
        spdlog::warn("runner: can't resolve source at startup: {}", fmtError(source.error()));
        return;
    }
    spdlog::info("runner: source host={} metro={} ({}) public_ip={} dz_ip={} user={}",
        source->host, source->metro, source->metroName, source->publicIp.to_string(),
        source->onOverlay() ? source->dzIp.to_string() : "-",
        source->user ? source->user->pubkey.toString() : "-");
}

boost::asio::awaitable<void> Runner::loop()
{
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::duration_cast<Clock::duration>(cfg.probeInterval);
    auto next = Clock::now();
    Context ctx(stopSource.get_token());

    while (!stopSource.stop_requested()) {
        tick(ctx);

        next += interval;
        auto now = Clock::now();
        if (next <= now) {
            auto missed = (now - next) / interval + 1;
            next += missed * interval;
            spdlog::warn("runner: tick overran the interval, skipping {} fire times", missed);
        }
        timer.expires_at(next);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec && ec != boost::asio::error::operation_aborted)
            spdlog::error("runner: timer error: {}", ec.message());
        if (ec) break;
    }

    spdlog::info("runner: stopping, closing {} targets", targetSet.len());
    targetSet.prune({});
    if (cfg.metrics) cfg.metrics->setTargets(0);
}

std::string Runner::finish(std::string outcome, std::chrono::steady_clock::time_point start)
{
    auto duration = std::chrono::steady_clock::now() - start;
    if (cfg.metrics) {
        cfg.metrics->tick(outcome);
        cfg.metrics->observeTickDuration(toSeconds(duration));
    }
    return outcome;
}

std::string Runner::tick(const Context& ctx)
{
    auto start = std::chrono::steady_clock::now();

    auto solana = cfg.solana->getGossipNodesAndValidators(ctx);
    if (isError(solana)) {
        spdlog::error("runner: failed to get solana validators: {}", fmtError(solana.error()));
        return finish("solana_err", start);
    }

    auto programData = cfg.serviceability->getProgramData(ctx);
    if (isError(programData)) {
        spdlog::error("runner: failed to get program data: {}", fmtError(programData.error()));
        return finish("dz_svc_err", start);
    }

    auto source = cfg.source->resolve(ctx, *programData);
    if (isError(source)) {
        spdlog::error("runner: failed to resolve source: {}", fmtError(source.error()));
        return finish("source_err", start);
    }

    if (source->onOverlay()) {
        auto routes = cfg.routes->getBgpRoutesByDst(ctx);
        if (isError(routes)) {
            spdlog::error("runner: failed to get routes: {}", fmtError(routes.error()));
            return finish("routes_err", start);
        }
        routeTable->update(std::move(*routes));
    }

    PlanInputs in{
        .gossipNodes = solana->gossipNodes,
        .validators = solana->validators,
        .programData = *programData,
        .source = *source,
        .routes = routeTable,
    };

    TargetMap merged;
    std::vector<std::pair<const Planner*, ProbePlan>> plans;
    for (const auto& planner : cfg.planners) {
        auto set = planner->buildPlans(in);
        if (isError(set)) {
            spdlog::error("runner: {} planner failed: {}",
                toString(planner->kind()), fmtError(set.error()));
            return finish(fmt::format("{}_plans_err", toString(planner->kind())), start);
        }
        // equal IDs from different planners share the first target
        merged.merge(set->targets);
        for (auto& plan : set->plans)
            plans.emplace_back(planner.get(), std::move(plan));
    }

    targetSet.update(std::move(merged));
    if (cfg.metrics) cfg.metrics->setTargets(targetSet.len());

    auto results = targetSet.executeProbes(ctx);
    if (isError(results)) {
        if (results.error() == ErrorCondition::Cancelled) {
            spdlog::info("runner: tick cancelled");
            return "cancelled";
        }
        spdlog::error("runner: failed to execute probes: {}", fmtError(results.error()));
        return finish("probes_err", start);
    }

    ResultsSummary summary;
    for (const auto& [planner, plan] : plans) {
        auto i = results->find(plan.id);
        if (i == results->end()) continue;
        const auto& result = i->second;
        if (cfg.metrics) {
            auto kind = toString(plan.kind);
            auto path = toString(plan.path);
            auto type = toString(probeTypeOf(plan.kind));
            if (result.ok)
                cfg.metrics->probeSuccess(kind, path, type);
            else if (result.failReason == FailReason::NotReady)
                cfg.metrics->probeNotReady(kind, path, type);
            else
                cfg.metrics->probeFail(kind, path, type, toString(result.failReason));
        }
        planner->record(plan, result, in, cfg.sink.get());
        summary.add(plan.kind, plan.path, result);
    }
    if (cfg.sink) cfg.sink->flush();

    auto duration = std::chrono::steady_clock::now() - start;
    summary.log(source->onOverlay(), duration);
    spdlog::info("runner: tick targets={} plans={} results={} duration={:.3f}s",
        targetSet.len(), plans.size(), results->size(), toSeconds(duration));
    return finish("ok", start);
}

} // namespace gmon
