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

#include "gmon/planner/sol_val_tpuquic.hpp"
#include "gmon/planner/common.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>


namespace gmon {

SolValTpuQuicPlanner::SolValTpuQuicPlanner(
    std::shared_ptr<QuicDialer> dialer, QuicTargetConfig quic, PlannerOptions opts)
    : dialer(std::move(dialer)), quic(std::move(quic)), opts(std::move(opts))
{
    if (!this->dialer) throw std::invalid_argument("sol/tpuquic: dialer is required");
}

Maybe<PlanSet> SolValTpuQuicPlanner::buildPlans(const PlanInputs& in) const
{
    const auto& src = in.source;
    if (src.publicIface.empty()) return Error(ErrorCode::InvalidArgument);
    planner::PlanBuilder builder(kind(), src);

    auto makeTarget = [&] (const std::string& iface, const std::string& hostPort,
        Preflight preflight)
    {
        return [this, iface, hostPort, preflight = std::move(preflight)] () -> ProbeTargetPtr {
            auto cfg = quic;
            cfg.preflight = preflight;
            return std::make_shared<QuicTarget>(iface, hostPort, dialer, std::move(cfg));
        };
    };

    for (auto&& [pk, val] : in.validators) {
        auto addr = val.node.tpuQuicAddr();
        if (!addr) continue;
        std::optional<PublicKey> targetUser;
        auto host = val.node.tpuQuicIp.to_string();
        if (auto i = in.programData.usersByDzIp.find(host); i != in.programData.usersByDzIp.end())
            targetUser = i->second.pubkey;
        builder.add(pk, makeQuicTargetId(src.publicIface, *addr), src.publicIface, *addr,
            targetUser, makeTarget(src.publicIface, *addr, nullptr));
    }

    if (!src.onOverlay()) return builder.take();

    for (auto&& [pk, val] : in.validators) {
        auto addr = val.node.tpuQuicAddr();
        if (!addr) continue;
        auto host = val.node.tpuQuicIp.to_string();
        auto user = in.programData.usersByDzIp.find(host);
        if (user == in.programData.usersByDzIp.end()) continue;
        if (planner::sameExchange(src, user->second)) continue;
        builder.add(pk, makeQuicTargetId(src.dzIface, *addr), src.dzIface, *addr,
            user->second.pubkey, makeTarget(src.dzIface, *addr,
                planner::routePreflight(in.routes, host)));
    }
    return builder.take();
}

void SolValTpuQuicPlanner::record(const ProbePlan& plan, const ProbeResult& result,
    const PlanInputs& in, PointSink* sink) const
{
    auto point = planner::makeBasePoint(plan, result, in, opts);
    if (!point || !sink) return;

    auto val = in.validators.find(plan.entity);
    if (val == in.validators.end()) {
        spdlog::warn("sol/tpuquic: validator {} not found", plan.entity);
        return;
    }
    planner::addValidator(*point, val->second);
    planner::addGeoIp(*point, val->second.geoIp);
    sink->write(std::move(*point));
}

} // namespace gmon
