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

#include "gmon/summary.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>


namespace gmon {

void ResultsSummary::add(PlanKind kind, ProbePath path, const ProbeResult& result)
{
    auto& b = buckets[std::make_pair(kind, path)];
    if (result.ok) {
        ++b.success;
    } else if (result.failReason == FailReason::NotReady) {
        ++b.notReady;
    } else {
        ++b.fail;
        ++b.failReasons[result.failReason];
    }
}

SummaryBucket ResultsSummary::bucket(PlanKind kind, ProbePath path) const
{
    if (auto i = buckets.find(std::make_pair(kind, path)); i != buckets.end())
        return i->second;
    return SummaryBucket{};
}

std::string ResultsSummary::format(PlanKind kind, ProbePath path) const
{
    auto b = bucket(kind, path);
    std::string reasons;
    for (auto&& [reason, n] : b.failReasons) {
        if (!reasons.empty()) reasons.push_back(',');
        reasons += fmt::format("{}:{}", toString(reason), n);
    }
    return fmt::format("kind={} path={} total={} success={} fail={} not_ready={} reasons=[{}]",
        toString(kind), toString(path), b.total(), b.success, b.fail, b.notReady, reasons);
}

void ResultsSummary::log(bool overlay, std::chrono::steady_clock::duration duration) const
{
    static constexpr PlanKind kinds[] = {
        PlanKind::SolValIcmp, PlanKind::SolValTpuQuic, PlanKind::DzUserIcmp
    };
    auto seconds = std::chrono::duration<double>(duration).count();
    for (auto kind : kinds) {
        spdlog::info("runner: summary {} duration={:.3f}s",
            format(kind, ProbePath::PublicInternet), seconds);
    }
    if (!overlay) return;
    for (auto kind : kinds) {
        spdlog::info("runner: summary {} duration={:.3f}s",
            format(kind, ProbePath::DoubleZero), seconds);
    }
}

} // namespace gmon
