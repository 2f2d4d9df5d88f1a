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

#include "gmon/planner/plan.hpp"
#include "gmon/probe/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <utility>


namespace gmon {

struct SummaryBucket
{
    std::size_t success = 0;
    std::size_t fail = 0;
    std::size_t notReady = 0;
    std::map<FailReason, std::size_t> failReasons;

    std::size_t total() const { return success + fail + notReady; }
};

/// \brief Per tick counts of probe outcomes by scenario and path.
class ResultsSummary
{
public:
    void add(PlanKind kind, ProbePath path, const ProbeResult& result);

    /// \brief Bucket of a scenario and path. Empty if nothing was added.
    SummaryBucket bucket(PlanKind kind, ProbePath path) const;

    /// \brief One line description of a bucket.
    std::string format(PlanKind kind, ProbePath path) const;

    /// \brief Log the public buckets and, if `overlay` is set, the overlay
    /// buckets.
    void log(bool overlay, std::chrono::steady_clock::duration duration) const;

private:
    std::map<std::pair<PlanKind, ProbePath>, SummaryBucket> buckets;
};

} // namespace gmon
