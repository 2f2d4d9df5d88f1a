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
#include "gmon/probe/icmp.hpp"

#include <memory>


namespace gmon {

/// \brief Pings every overlay user at its client address and, except for
/// multicast users, at its overlay address.
class DzUserIcmpPlanner : public Planner
{
public:
    DzUserIcmpPlanner(std::shared_ptr<Pinger> pinger, IcmpTargetConfig icmp = {},
        PlannerOptions opts = {});

    PlanKind kind() const override { return PlanKind::DzUserIcmp; }

    Maybe<PlanSet> buildPlans(const PlanInputs& in) const override;

    void record(const ProbePlan& plan, const ProbeResult& result,
        const PlanInputs& in, PointSink* sink) const override;

private:
    std::shared_ptr<Pinger> pinger;
    IcmpTargetConfig icmp;
    PlannerOptions opts;
};

} // namespace gmon
