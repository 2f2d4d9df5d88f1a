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
#include "gmon/probe/target.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>


namespace gmon {

struct TargetSetConfig
{
    std::size_t maxConcurrency = 128;
    std::chrono::nanoseconds probeTimeout = std::chrono::seconds(8);
};

using ResultMap = std::map<ProbeTargetId, ProbeResult>;

/// \brief Registry of live probe targets.
///
/// Targets are closed exactly once when they leave the registry. Probing and
/// closing run on a shared pool of `maxConcurrency` threads. Each phase waits
/// for all of its work items before returning, so a target is never probed
/// and closed at the same time.
class TargetSet
{
public:
    TargetSet(TargetSetConfig config, std::shared_ptr<const Clock> clock,
        Metrics* metrics = nullptr);
    TargetSet(const TargetSet&) = delete;
    TargetSet& operator=(const TargetSet&) = delete;
    ~TargetSet();

    /// \brief Make `targets` the registry, keeping already registered
    /// instances of IDs present in both.
    void update(TargetMap targets);

    /// \brief Close all registered targets not in `targets` and replace the
    /// registry with `targets`.
    void prune(TargetMap targets);

    /// \brief Probe all registered targets.
    /// \return Results by target ID, stamped with the clock time at the
    /// beginning of the call. Cancelled probes have no result.
    Maybe<ResultMap> executeProbes(const Context& ctx);

    std::size_t len() const;

    /// \brief Copy of the registry.
    TargetMap targets() const;

private:
    TargetSetConfig cfg;
    std::shared_ptr<const Clock> clock;
    Metrics* metrics;

    mutable std::mutex mutex;
    TargetMap registry;
    boost::asio::thread_pool pool;
};

} // namespace gmon
