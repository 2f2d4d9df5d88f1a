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

#include "gmon/target_set.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <latch>
#include <optional>
#include <stdexcept>
#include <vector>


namespace gmon {

TargetSet::TargetSet(TargetSetConfig config, std::shared_ptr<const Clock> clock, Metrics* metrics)
    : cfg(config), clock(std::move(clock)), metrics(metrics)
    , pool(config.maxConcurrency)
{
    if (cfg.maxConcurrency == 0)
        throw std::invalid_argument("max concurrency must be positive");
    if (cfg.probeTimeout <= std::chrono::nanoseconds::zero())
        throw std::invalid_argument("probe timeout must be positive");
    if (!this->clock)
        throw std::invalid_argument("clock is required");
}

TargetSet::~TargetSet()
{
    pool.join();
}

void TargetSet::update(TargetMap targets)
{
    {
        std::lock_guard lock(mutex);
        for (auto& [id, target] : targets) {
            if (auto i = registry.find(id); i != registry.end())
                target = i->second;
        }
    }
    prune(std::move(targets));
}

void TargetSet::prune(TargetMap targets)
{
    std::vector<ProbeTargetPtr> removed;
    {
        std::lock_guard lock(mutex);
        for (auto& [id, target] : registry) {
            auto i = targets.find(id);
            if (i == targets.end() || i->second != target)
                removed.push_back(target);
        }
        registry = std::move(targets);
    }
    if (removed.empty()) return;

    std::latch done((std::ptrdiff_t)removed.size());
    for (auto& target : removed) {
        boost::asio::post(pool, [&target, &done] {
            try {
                target->close();
            } catch (const std::exception& e) {
                spdlog::error("targets: error closing {}: {}", target->id(), e.what());
            }
            done.count_down();
        });
    }
    done.wait();

    spdlog::debug("targets: pruned {} targets", removed.size());
    if (metrics) metrics->targetsPruned(removed.size());
}

Maybe<ResultMap> TargetSet::executeProbes(const Context& ctx)
{
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);

    auto now = clock->now();
    auto targets = this->targets();

    ResultMap results;
    std::mutex resultsMutex;
    std::latch done((std::ptrdiff_t)targets.size());

    for (auto& [id, target] : targets) {
        boost::asio::post(pool, [&, target = target] {
            auto probeCtx = ctx.withTimeout(cfg.probeTimeout);
            std::optional<ProbeResult> result;
            try {
                auto res = target->probe(probeCtx);
                if (res.has_value()) {
                    result = std::move(*res);
                } else if (res.error() == ErrorCode::DeadlineExceeded) {
                    result = ProbeResult::Failure(FailReason::Timeout, res.error());
                } else if (res.error() != ErrorCondition::Cancelled) {
                    spdlog::error("targets: probe {} failed: {}", target->id(), fmtError(res.error()));
                }
            } catch (const std::exception& e) {
                spdlog::error("targets: probe {} failed: {}", target->id(), e.what());
            }
            if (result) {
                result->timestamp = now;
                std::lock_guard lock(resultsMutex);
                results.emplace(target->id(), std::move(*result));
            }
            done.count_down();
        });
    }
    done.wait();

    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
    return results;
}

std::size_t TargetSet::len() const
{
    std::lock_guard lock(mutex);
    return registry.size();
}

TargetMap TargetSet::targets() const
{
    std::lock_guard lock(mutex);
    return registry;
}

} // namespace gmon
