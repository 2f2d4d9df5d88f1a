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

#include "gmon/planner/dz_user_icmp.hpp"
#include "gmon/planner/common.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>


namespace gmon {

DzUserIcmpPlanner::DzUserIcmpPlanner(
    std::shared_ptr<Pinger> pinger, IcmpTargetConfig icmp, PlannerOptions opts)
    : pinger(std::move(pinger)), icmp(std::move(icmp)), opts(std::move(opts))
{
    if (!this->pinger) throw std::invalid_argument("dz/icmp: pinger is required");
}

Maybe<PlanSet> DzUserIcmpPlanner::buildPlans(const PlanInputs& in) const
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

    for (auto&& [pk, user] : in.programData.usersByPk) {
        if (!isUsable(user.clientIp)) continue;
        auto ip = user.clientIp.to_string();
        builder.add(pk, makeIcmpTargetId(src.publicIface, ip), src.publicIface, ip,
            pk, makeTarget(src.publicIface, user.clientIp, nullptr));
    }

    if (!src.onOverlay()) return builder.take();

    for (auto&& [pk, user] : in.programData.usersByPk) {
        if (!isUsable(user.dzIp)) continue;
        if (user.userType == UserType::Multicast) continue;
        if (planner::sameExchange(src, user)) continue;
        auto ip = user.dzIp.to_string();
        builder.add(pk, makeIcmpTargetId(src.dzIface, ip), src.dzIface, ip,
            pk, makeTarget(src.dzIface, user.dzIp, planner::routePreflight(in.routes, ip)));
    }
    return builder.take();
}

void DzUserIcmpPlanner::record(const ProbePlan& plan, const ProbeResult& result,
    const PlanInputs& in, PointSink* sink) const
{
    auto point = planner::makeBasePoint(plan, result, in, opts);
    if (!point || !sink) return;

    auto i = in.programData.usersByPk.find(plan.entity);
    if (i == in.programData.usersByPk.end()) {
        spdlog::warn("dz/icmp: user {} not found", plan.entity);
        return;
    }
    const auto& user = i->second;

    bool inVoteAccounts = false;
    bool inGossip = false;
    if (!user.validatorPk.isZero()) {
        if (auto val = in.validators.find(user.validatorPk); val != in.validators.end()) {
            inVoteAccounts = true;
            const auto& vote = val->second.voteAccount.votePubkey;
            if (!vote.isZero()) point->tags["validator_vote_pubkey"] = vote.toString();
        }
        inGossip = in.gossipNodes.contains(user.validatorPk);
    }

    boost::system::error_code ec;
    auto target = boost::asio::ip::make_address_v4(plan.targetAddr, ec);
    bool ipInGossip = false;
    bool ipInGossipAsTpuQuic = false;
    if (!ec) {
        ipInGossip = std::ranges::any_of(in.gossipNodes, [&] (auto&& entry) {
            return entry.second.gossipIp == target;
        });
        ipInGossipAsTpuQuic = std::ranges::any_of(in.gossipNodes, [&] (auto&& entry) {
            return entry.second.tpuQuicIp == target;
        });
    }

    auto& fields = point->fields;
    fields["user_validator_pubkey_in_solana_vote_accounts"] = inVoteAccounts;
    fields["user_validator_pubkey_in_solana_gossip"] = inGossip;
    fields["target_ip_in_solana_gossip"] = ipInGossip;
    fields["target_ip_in_solana_gossip_as_tpuquic"] = ipInGossipAsTpuQuic;

    if (opts.geoIp && isUsable(user.clientIp))
        planner::addGeoIp(*point, opts.geoIp->resolve(user.clientIp));
    sink->write(std::move(*point));
}

} // namespace gmon
