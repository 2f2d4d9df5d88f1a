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

#include <boost/asio/ip/address_v4.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>


namespace gmon {
namespace planner {

/// \brief A target belongs to the overlay path iff it is sent from the
/// overlay interface.
ProbePath pathOf(const Source& source, const std::string& iface);

/// \brief True if `user` is behind the same exchange as the vantage point.
bool sameExchange(const Source& source, const User& user);

/// \brief Preflight that fails with FailReason::NoRoute unless `dst` is a
/// destination in the routing table.
Preflight routePreflight(std::shared_ptr<const RouteTable> routes, std::string dst);

/// \brief "a.b.c.0/24" block of an address.
std::string ipBlock24(const boost::asio::ip::address_v4& ip);

/// \brief Split "host:port" at the last colon. The port is empty if there is
/// no colon.
std::pair<std::string, std::string> splitHostPort(std::string_view hostPort);

/// \brief Accumulates targets and plans of one planner, keeping the first
/// target and plan for each ID.
class PlanBuilder
{
public:
    using Factory = std::function<ProbeTargetPtr()>;

    PlanBuilder(PlanKind kind, const Source& source)
        : kind(kind), source(source)
    {}

    /// \brief Register `entity` as a user of target `id`. The target is
    /// created by `make` and a plan emitted only the first time an ID is
    /// seen.
    void add(const PublicKey& entity, const ProbeTargetId& id, const std::string& iface,
        const std::string& addr, std::optional<PublicKey> targetUser, const Factory& make);

    PlanSet take() { return std::move(set); }

private:
    PlanKind kind;
    const Source& source;
    PlanSet set;
};

/// \brief Build the point shared by all scenarios: probe outcome, source tags
/// and tags of the target address and target user.
/// \return Nothing if the result must not be written.
std::optional<Point> makeBasePoint(const ProbePlan& plan, const ProbeResult& result,
    const PlanInputs& in, const PlannerOptions& opts);

void addGeoIp(Point& point, const std::optional<GeoRecord>& geo);

/// \brief Add validator identity, vote account and stake.
void addValidator(Point& point, const Validator& val);

} // namespace planner
} // namespace gmon
