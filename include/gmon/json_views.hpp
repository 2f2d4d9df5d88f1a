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

#include "gmon/geoip.hpp"
#include "gmon/serviceability.hpp"
#include "gmon/solana.hpp"

#include <boost/json/value.hpp>

#include <filesystem>
#include <memory>


namespace gmon {

/// \brief Reads gossip nodes and validators from a JSON snapshot file.
///
/// The file is read again on every call. Expected layout:
/// ```json
/// {
///   "gossip_nodes": [{"pubkey": "...", "gossip_ip": "a.b.c.d", "gossip_port": 8001,
///                     "tpuquic_ip": "a.b.c.d", "tpuquic_port": 8009}],
///   "validators": [{"node_pubkey": "...", "vote_pubkey": "...",
///                   "activated_stake": 0, "leader_ratio": 0.0}]
/// }
/// ```
/// Validators are annotated with the GeoIP record of their gossip address.
class JsonSolanaView : public SolanaView
{
public:
    JsonSolanaView(std::filesystem::path path, std::shared_ptr<const GeoIpResolver> geoIp);

    Maybe<SolanaSnapshot> getGossipNodesAndValidators(const Context& ctx) override;

    /// \brief Build a snapshot from parsed JSON.
    static Maybe<SolanaSnapshot> Parse(const boost::json::value& data, const GeoIpResolver* geoIp);

private:
    std::filesystem::path path;
    std::shared_ptr<const GeoIpResolver> geoIp;
};

/// \brief Reads the serviceability program state from a JSON snapshot file.
///
/// Expected layout:
/// ```json
/// {
///   "exchanges": [{"pubkey": "...", "code": "xams", "name": "Amsterdam"}],
///   "devices": [{"pubkey": "...", "code": "ams-dz01", "exchange_pubkey": "..."}],
///   "users": [{"pubkey": "...", "user_type": "IBRL", "client_ip": "a.b.c.d",
///              "dz_ip": "a.b.c.d", "validator_pubkey": "...", "device_pubkey": "..."}]
/// }
/// ```
class JsonServiceabilityView : public ServiceabilityView
{
public:
    explicit JsonServiceabilityView(std::filesystem::path path);

    Maybe<ProgramData> getProgramData(const Context& ctx) override;

    static Maybe<ProgramData> Parse(const boost::json::value& data);

private:
    std::filesystem::path path;
};

} // namespace gmon
