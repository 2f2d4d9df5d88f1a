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
#include "gmon/probe/quic.hpp"

#include <memory>


namespace gmon {

/// \brief Keeps QUIC connections to the TPU endpoint of every validator.
/// Overlay targets are built for validators whose TPU address belongs to an
/// overlay user.
class SolValTpuQuicPlanner : public Planner
{
public:
    SolValTpuQuicPlanner(std::shared_ptr<QuicDialer> dialer, QuicTargetConfig quic = {},
        PlannerOptions opts = {});

    PlanKind kind() const override { return PlanKind::SolValTpuQuic; }

    Maybe<PlanSet> buildPlans(const PlanInputs& in) const override;

    void record(const ProbePlan& plan, const ProbeResult& result,
        const PlanInputs& in, PointSink* sink) const override;

private:
    std::shared_ptr<QuicDialer> dialer;
    QuicTargetConfig quic;
    PlannerOptions opts;
};

} // namespace gmon
