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

#include "gmon/error_codes.hpp"
#include "gmon/probe/target.hpp"
#include "gmon/public_key.hpp"
#include "gmon/routes.hpp"
#include "gmon/serviceability.hpp"
#include "gmon/sink.hpp"
#include "gmon/solana.hpp"
#include "gmon/source.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace gmon {

/// \brief Measurement scenario.
enum class PlanKind
{
    SolValIcmp,    ///< ICMP to validator gossip addresses
    SolValTpuQuic, ///< QUIC handshakes to validator TPU endpoints
    DzUserIcmp,    ///< ICMP to overlay users
};

inline const char* toString(PlanKind kind)
{
    switch (kind) {
    case PlanKind::SolValIcmp:
        return "sol_val_icmp";
    case PlanKind::SolValTpuQuic:
        return "sol_val_tpuquic";
    case PlanKind::DzUserIcmp:
        return "dz_user_icmp";
    default:
        return "error";
    }
}

inline ProbeType probeTypeOf(PlanKind kind)
{
    return kind == PlanKind::SolValTpuQuic ? ProbeType::TPUQUIC : ProbeType::ICMP;
}

/// \brief Name of the measurement the results of a scenario are written to.
inline const char* measurementOf(PlanKind kind)
{
    switch (kind) {
    case PlanKind::SolValIcmp:
        return "solana_validator_icmp_probe";
    case PlanKind::SolValTpuQuic:
        return "solana_validator_tpuquic_probe";
    case PlanKind::DzUserIcmp:
        return "doublezero_user_icmp_probe";
    default:
        return "error";
    }
}

/// \brief Describes one deduplicated probe and the entity its result is
/// recorded for.
struct ProbePlan
{
    ProbeTargetId id;
    PlanKind kind = PlanKind::SolValIcmp;
    ProbePath path = ProbePath::PublicInternet;
    std::string iface;
    std::string targetAddr;  ///< IP or host:port
    PublicKey entity;        ///< validator identity or user key
    std::optional<PublicKey> targetUser; ///< overlay user owning the target address
};

/// \brief Immutable state of one tick shared by all planners.
struct PlanInputs
{
    const GossipNodeMap& gossipNodes;
    const ValidatorMap& validators;
    const ProgramData& programData;
    const Source& source;
    /// Consulted by preflight checks of overlay targets.
    std::shared_ptr<const RouteTable> routes;
};

struct PlanSet
{
    std::map<PublicKey, std::vector<ProbeTargetPtr>> targetsByEntity;
    std::vector<ProbePlan> plans;
    TargetMap targets; ///< deduplicated by ID
};

/// \brief Turns a tick's domain snapshot into probe targets and records the
/// results of those probes.
class Planner
{
public:
    virtual ~Planner() = default;

    virtual PlanKind kind() const = 0;

    virtual Maybe<PlanSet> buildPlans(const PlanInputs& in) const = 0;

    /// \brief Write the result of a plan to `sink`. Does nothing if `sink`
    /// is null or the result is not ready.
    virtual void record(const ProbePlan& plan, const ProbeResult& result,
        const PlanInputs& in, PointSink* sink) const = 0;
};

/// \brief Options shared by all planners.
struct PlannerOptions
{
    std::shared_ptr<const GeoIpResolver> geoIp;
    bool verboseFailures = false;
    bool verboseSuccesses = false;
};

} // namespace gmon
