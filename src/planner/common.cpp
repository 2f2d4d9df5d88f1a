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

#include "gmon/planner/common.hpp"

#include <spdlog/spdlog.h>

#include <chrono>


namespace gmon {
namespace planner {

static double toMs(std::chrono::nanoseconds d)
{
    return std::chrono::duration<double, std::milli>(d).count();
}

ProbePath pathOf(const Source& source, const std::string& iface)
{
    if (source.onOverlay() && iface == source.dzIface)
        return ProbePath::DoubleZero;
    return ProbePath::PublicInternet;
}

bool sameExchange(const Source& source, const User& user)
{
    if (!source.user) return false;
    auto own = source.user->exchangeCode();
    if (own.empty()) return false;
    return user.exchangeCode() == own;
}

Preflight routePreflight(std::shared_ptr<const RouteTable> routes, std::string dst)
{
    return [routes = std::move(routes), dst = std::move(dst)] (const Context&)
        -> std::optional<FailReason>
    {
        if (routes && routes->contains(dst)) return std::nullopt;
        return FailReason::NoRoute;
    };
}

std::string ipBlock24(const boost::asio::ip::address_v4& ip)
{
    auto block = boost::asio::ip::address_v4(ip.to_uint() & 0xffffff00u);
    return block.to_string() + "/24";
}

std::pair<std::string, std::string> splitHostPort(std::string_view hostPort)
{
    auto colon = hostPort.rfind(':');
    if (colon == hostPort.npos) return {std::string(hostPort), std::string()};
    return {std::string(hostPort.substr(0, colon)), std::string(hostPort.substr(colon + 1))};
}

/////////////////
// PlanBuilder //
/////////////////

void PlanBuilder::add(const PublicKey& entity, const ProbeTargetId& id,
    const std::string& iface, const std::string& addr, std::optional<PublicKey> targetUser,
    const Factory& make)
{
    auto [i, inserted] = set.targets.try_emplace(id);
    if (inserted) {
        i->second = make();
        set.plans.push_back(ProbePlan{
            .id = id,
            .kind = kind,
            .path = pathOf(source, iface),
            .iface = iface,
            .targetAddr = addr,
            .entity = entity,
            .targetUser = targetUser,
        });
    }
    set.targetsByEntity[entity].push_back(i->second);
}

///////////////
// Recording //
///////////////

static void logResult(const ProbePlan& plan, const ProbeResult& result, const PlannerOptions& opts)
{
    if (result.ok && opts.verboseSuccesses) {
        spdlog::info("{}: probe ok target={} path={} rtt_avg_ms={:.3f} loss={:.3f}",
            toString(plan.kind), plan.targetAddr, toString(plan.path),
            result.stats ? toMs(result.stats->rttAvg) : 0.0,
            result.stats ? result.stats->lossRatio : 0.0);
    } else if (!result.ok && opts.verboseFailures) {
        spdlog::info("{}: probe failed target={} path={} reason={} error={}",
            toString(plan.kind), plan.targetAddr, toString(plan.path),
            toString(result.failReason), result.error ? result.error.message() : "");
    }
}

std::optional<Point> makeBasePoint(const ProbePlan& plan, const ProbeResult& result,
    const PlanInputs& in, const PlannerOptions& opts)
{
    if (result.failReason == FailReason::NotReady) return std::nullopt;
    logResult(plan, result, opts);

    const auto& src = in.source;
    boost::asio::ip::address_v4 sourceIp;
    if (plan.iface == src.publicIface) {
        sourceIp = src.publicIp;
    } else if (src.onOverlay() && plan.iface == src.dzIface) {
        sourceIp = src.dzIp;
    } else {
        spdlog::error("{}: unknown source interface {} for {}",
            toString(plan.kind), plan.iface, plan.id);
        return std::nullopt;
    }
    if (result.ok && !result.stats) {
        spdlog::error("{}: successful probe without stats for {}", toString(plan.kind), plan.id);
        return std::nullopt;
    }

    Point point;
    point.measurement = measurementOf(plan.kind);
    point.timestamp = result.timestamp;

    auto& tags = point.tags;
    tags["probe_type"] = toString(probeTypeOf(plan.kind));
    tags["probe_path"] = toString(plan.path);
    tags["source_metro"] = src.metro;
    tags["source_metro_name"] = src.metroName;
    tags["source_host"] = src.host;
    tags["source_iface"] = plan.iface;
    tags["source_ip"] = sourceIp.to_string();
    if (src.user) {
        tags["source_user_pubkey"] = src.user->pubkey.toString();
        if (src.user->device) {
            const auto& dev = *src.user->device;
            tags["source_dzd_code"] = dev.code;
            if (dev.exchange) {
                tags["source_dzd_metro_code"] = dev.exchange->code;
                tags["source_dzd_metro_name"] = dev.exchange->name;
            }
        }
    }

    auto [host, port] = splitHostPort(plan.targetAddr);
    if (probeTypeOf(plan.kind) != ProbeType::TPUQUIC) {
        host = plan.targetAddr;
        port.clear();
    }
    tags["target_ip"] = host;
    boost::system::error_code ec;
    if (auto ip = boost::asio::ip::make_address_v4(host, ec); !ec)
        tags["target_ip_block_24"] = ipBlock24(ip);
    if (!port.empty()) {
        tags["target_port"] = port;
        tags["target_endpoint"] = plan.targetAddr;
    }

    if (plan.targetUser) {
        if (auto i = in.programData.usersByPk.find(*plan.targetUser);
            i != in.programData.usersByPk.end()) {
            const auto& user = i->second;
            tags["user_pubkey"] = user.pubkey.toString();
            if (!user.validatorPk.isZero())
                tags["user_validator_pubkey"] = user.validatorPk.toString();
            if (user.device) {
                tags["target_dzd_code"] = user.device->code;
                if (user.device->exchange) {
                    tags["target_dzd_metro_code"] = user.device->exchange->code;
                    tags["target_dzd_metro_name"] = user.device->exchange->name;
                }
            }
        }
    }

    auto& fields = point.fields;
    fields["probe_ok"] = result.ok;
    if (!result.ok)
        fields["probe_fail_reason"] = std::string(toString(result.failReason));
    if (result.stats) {
        const auto& stats = *result.stats;
        fields["probe_rtt_avg_ms"] = toMs(stats.rttAvg);
        fields["probe_rtt_latest_ms"] = toMs(stats.rttAvg);
        fields["probe_rtt_min_ms"] = toMs(stats.rttMin);
        fields["probe_rtt_dev_ms"] = toMs(stats.rttStdDev);
        fields["probe_packets_sent"] = (std::int64_t)stats.packetsSent;
        fields["probe_packets_recv"] = (std::int64_t)stats.packetsRecv;
        fields["probe_packets_lost"] = (std::int64_t)stats.packetsLost;
        fields["probe_loss_ratio"] = stats.lossRatio;
    }
    return point;
}

void addGeoIp(Point& point, const std::optional<GeoRecord>& geo)
{
    if (!geo) return;
    auto& tags = point.tags;
    tags["target_geoip_country"] = geo->country;
    tags["target_geoip_country_code"] = geo->countryCode;
    tags["target_geoip_region"] = geo->region;
    tags["target_geoip_city"] = geo->city;
    if (geo->cityId != 0)
        tags["target_geoip_city_id"] = std::to_string(geo->cityId);
    tags["target_geoip_metro"] = geo->metroName;
    if (geo->asn != 0)
        tags["target_geoip_asn"] = std::to_string(geo->asn);
    tags["target_geoip_asn_org"] = geo->asnOrg;
    point.fields["target_geoip_latitude"] = geo->latitude;
    point.fields["target_geoip_longitude"] = geo->longitude;
}

void addValidator(Point& point, const Validator& val)
{
    point.tags["validator_pubkey"] = val.node.pubkey.toString();
    if (!val.voteAccount.votePubkey.isZero())
        point.tags["validator_vote_pubkey"] = val.voteAccount.votePubkey.toString();
    point.fields["validator_leader_ratio"] = val.leaderRatio;
    point.fields["validator_stake_lamports"] = (std::int64_t)val.voteAccount.activatedStake;
}

} // namespace planner
} // namespace gmon
