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

#include "gmon/context.hpp"
#include "gmon/geoip.hpp"
#include "gmon/public_key.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>


namespace gmon {

/// \brief An address is usable as a probe destination if it is set.
inline bool isUsable(const boost::asio::ip::address_v4& ip)
{
    return !ip.is_unspecified();
}

/// \brief Cluster node as advertised in Solana gossip. Unset addresses are
/// unspecified (0.0.0.0).
struct GossipNode
{
    PublicKey pubkey;
    boost::asio::ip::address_v4 gossipIp;
    std::uint16_t gossipPort = 0;
    boost::asio::ip::address_v4 tpuQuicIp;
    std::uint16_t tpuQuicPort = 0;

    /// \brief TPU QUIC endpoint as "ip:port" if the node advertises one.
    std::optional<std::string> tpuQuicAddr() const
    {
        if (!isUsable(tpuQuicIp) || tpuQuicPort == 0) return std::nullopt;
        return tpuQuicIp.to_string() + ":" + std::to_string(tpuQuicPort);
    }
};

struct VoteAccount
{
    PublicKey votePubkey;
    std::uint64_t activatedStake = 0; ///< lamports
};

struct Validator
{
    GossipNode node;
    VoteAccount voteAccount;
    double leaderRatio = 0.0; ///< share of leader slots in the current epoch
    std::optional<GeoRecord> geoIp;
};

using GossipNodeMap = std::map<PublicKey, GossipNode>;
using ValidatorMap = std::map<PublicKey, Validator>;

struct SolanaSnapshot
{
    GossipNodeMap gossipNodes;
    ValidatorMap validators;
};

/// \brief Source of Solana gossip and validator data, keyed by node identity.
class SolanaView
{
public:
    virtual ~SolanaView() = default;
    virtual Maybe<SolanaSnapshot> getGossipNodesAndValidators(const Context& ctx) = 0;
};

} // namespace gmon
