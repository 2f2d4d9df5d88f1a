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

#include "gmon/json_views.hpp"
#include "gmon/details/json.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <vector>


namespace gmon {

class SnapshotError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

static PublicKey parseKey(const boost::json::object& obj, std::string_view key, bool required)
{
    auto value = obj.if_contains(key);
    if (!value || value->is_null()) {
        if (required) throw SnapshotError(fmt::format("missing '{}'", key));
        return PublicKey();
    }
    auto str = std::string_view(value->as_string());
    if (str.empty() && !required) return PublicKey();
    auto pk = PublicKey::Parse(str);
    if (isError(pk)) throw SnapshotError(fmt::format("invalid public key '{}'", str));
    return *pk;
}

static boost::asio::ip::address_v4 parseIp(const boost::json::object& obj, std::string_view key)
{
    auto value = obj.if_contains(key);
    if (!value || value->is_null()) return {};
    auto str = std::string(value->as_string());
    if (str.empty()) return {};
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address_v4(str, ec);
    if (ec) throw SnapshotError(fmt::format("invalid IPv4 address '{}'", str));
    return ip;
}

static std::uint16_t parsePort(const boost::json::object& obj, std::string_view key)
{
    auto value = obj.if_contains(key);
    if (!value || value->is_null()) return 0;
    auto port = value->to_number<std::int64_t>();
    if (port < 0 || port > 65535) throw SnapshotError(fmt::format("invalid port {}", port));
    return (std::uint16_t)port;
}

static std::string parseString(const boost::json::object& obj, std::string_view key)
{
    if (auto value = obj.if_contains(key); value && value->is_string())
        return std::string(value->as_string());
    return {};
}

////////////////////
// JsonSolanaView //
////////////////////

JsonSolanaView::JsonSolanaView(
    std::filesystem::path path, std::shared_ptr<const GeoIpResolver> geoIp)
    : path(std::move(path)), geoIp(std::move(geoIp))
{}

Maybe<SolanaSnapshot> JsonSolanaView::getGossipNodesAndValidators(const Context& ctx)
{
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
    auto data = details::loadJsonFile(path);
    if (isError(data)) {
        spdlog::error("solana: failed to read {}: {}", path.string(), fmtError(data.error()));
        return propagateError(data);
    }
    return Parse(*data, geoIp.get());
}

Maybe<SolanaSnapshot> JsonSolanaView::Parse(
    const boost::json::value& data, const GeoIpResolver* geoIp)
{
    SolanaSnapshot snap;
    try {
        const auto& root = data.as_object();
        if (auto nodes = root.if_contains("gossip_nodes"); nodes) {
            for (auto&& item : nodes->as_array()) {
                const auto& obj = item.as_object();
                GossipNode node;
                node.pubkey = parseKey(obj, "pubkey", true);
                node.gossipIp = parseIp(obj, "gossip_ip");
                node.gossipPort = parsePort(obj, "gossip_port");
                node.tpuQuicIp = parseIp(obj, "tpuquic_ip");
                node.tpuQuicPort = parsePort(obj, "tpuquic_port");
                snap.gossipNodes[node.pubkey] = node;
            }
        }
        if (auto validators = root.if_contains("validators"); validators) {
            for (auto&& item : validators->as_array()) {
                const auto& obj = item.as_object();
                Validator val;
                val.node.pubkey = parseKey(obj, "node_pubkey", true);
                if (auto i = snap.gossipNodes.find(val.node.pubkey); i != snap.gossipNodes.end())
                    val.node = i->second;
                val.voteAccount.votePubkey = parseKey(obj, "vote_pubkey", false);
                if (auto stake = obj.if_contains("activated_stake"); stake)
                    val.voteAccount.activatedStake = stake->to_number<std::uint64_t>();
                if (auto ratio = obj.if_contains("leader_ratio"); ratio)
                    val.leaderRatio = ratio->to_number<double>();
                if (geoIp && isUsable(val.node.gossipIp))
                    val.geoIp = geoIp->resolve(val.node.gossipIp);
                snap.validators[val.node.pubkey] = std::move(val);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("solana: invalid snapshot: {}", e.what());
        return Error(ErrorCode::InvalidJson);
    }
    return snap;
}

////////////////////////////
// JsonServiceabilityView //
////////////////////////////

JsonServiceabilityView::JsonServiceabilityView(std::filesystem::path path)
    : path(std::move(path))
{}

Maybe<ProgramData> JsonServiceabilityView::getProgramData(const Context& ctx)
{
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
    auto data = details::loadJsonFile(path);
    if (isError(data)) {
        spdlog::error("serviceability: failed to get program data: {}", fmtError(data.error()));
        return propagateError(data);
    }
    return Parse(*data);
}

Maybe<ProgramData> JsonServiceabilityView::Parse(const boost::json::value& data)
{
    std::vector<Exchange> exchanges;
    std::vector<Device> devices;
    std::vector<User> users;
    try {
        const auto& root = data.as_object();
        if (auto raw = root.if_contains("exchanges"); raw) {
            for (auto&& item : raw->as_array()) {
                const auto& obj = item.as_object();
                exchanges.push_back(Exchange{
                    .pubkey = parseKey(obj, "pubkey", true),
                    .code = parseString(obj, "code"),
                    .name = parseString(obj, "name"),
                });
            }
        }
        if (auto raw = root.if_contains("devices"); raw) {
            for (auto&& item : raw->as_array()) {
                const auto& obj = item.as_object();
                Device dev;
                dev.pubkey = parseKey(obj, "pubkey", true);
                dev.code = parseString(obj, "code");
                dev.exchangePk = parseKey(obj, "exchange_pubkey", false);
                devices.push_back(std::move(dev));
            }
        }
        if (auto raw = root.if_contains("users"); raw) {
            for (auto&& item : raw->as_array()) {
                const auto& obj = item.as_object();
                User user;
                user.pubkey = parseKey(obj, "pubkey", true);
                user.userType = userTypeFromString(parseString(obj, "user_type"));
                user.clientIp = parseIp(obj, "client_ip");
                user.dzIp = parseIp(obj, "dz_ip");
                user.validatorPk = parseKey(obj, "validator_pubkey", false);
                user.devicePk = parseKey(obj, "device_pubkey", false);
                users.push_back(std::move(user));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("serviceability: failed to get program data: {}", e.what());
        return Error(ErrorCode::InvalidJson);
    }
    return ProgramData::Build(exchanges, devices, users);
}

} // namespace gmon
