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

#include "gmon/planner/sol_val_icmp.hpp"
#include "gmon/planner/common.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>


namespace gmon {

SolValIcmpPlanner::SolValIcmpPlanner(
    std::shared_ptr<Pinger> pinger, IcmpTargetConfig icmp, PlannerOptions opts)
    : pinger(std::move(pinger)), icmp(std::move(icmp)), opts(std::move(opts))
{
    if (!this->pinger) throw std::invalid_argument("sol/icmp: pinger is required");
}

Maybe<PlanSet> SolValIcmpPlanner::buildPlans(const PlanInputs& in) const
{
    const auto& src = in.source;
    if (src.publicIface.empty()) return Error(ErrorCode::InvalidArgument);
    planner::PlanBuilder builder(kind(), src);

    auto makeTarget = [&] (const std::string& iface, boost::asio::ip::address_v4 ip,
        Preflight preflight)
    {
        return [this, iface, ip, preflight = std::move(preflight)] () -> ProbeTargetPtr {
            auto cfg = icmp;
            cfg.preflight = preflight;
            return std::make_shared<IcmpTarget>(iface, ip, pinger, std::move(cfg));
        };
    };

    auto targetUserOf = [&] (const std::string& ip) -> std::optional<PublicKey> {
        if (auto i = in.programData.usersByDzIp.find(ip); i != in.programData.usersByDzIp.end())
            return i->second.pubkey;
        return std::nullopt;
    };

    for (auto&& [pk, val] : in.validators) {
        if (!isUsable(val.node.gossipIp)) continue;
        auto ip = val.node.gossipIp.to_string();
        builder.add(pk, makeIcmpTargetId(src.publicIface, ip), src.publicIface, ip,
            targetUserOf(ip), makeTarget(src.publicIface, val.node.gossipIp, nullptr));
    }

    if (!src.onOverlay()) return builder.take();

    for (auto&& [pk, val] : in.validators) {
        if (!isUsable(val.node.gossipIp)) continue;
        auto ip = val.node.gossipIp.to_string();
        auto user = in.programData.usersByDzIp.find(ip);
        if (user == in.programData.usersByDzIp.end()) continue;
        if (planner::sameExchange(src, user->second)) continue;
        builder.add(pk, makeIcmpTargetId(src.dzIface, ip), src.dzIface, ip,
            user->second.pubkey, makeTarget(src.dzIface, val.node.gossipIp,
                planner::routePreflight(in.routes, ip)));
    }
    return builder.take();
}

void SolValIcmpPlanner::record(const ProbePlan& plan, const ProbeResult& result,
    const PlanInputs& in, PointSink* sink) const
{
    auto point = planner::makeBasePoint(plan, result, in, opts);
    if (!point || !sink) return;

    auto val = in.validators.find(plan.entity);
    if (val == in.validators.end()) {
        spdlog::warn("sol/icmp: validator {} not found", plan.entity);
        return;
    }
    planner::addValidator(*point, val->second);
    planner::addGeoIp(*point, val->second.geoIp);
    sink->write(std::move(*point));
}

} // namespace gmon
