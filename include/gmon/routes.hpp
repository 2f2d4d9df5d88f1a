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

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>


namespace gmon {

struct Route
{
    boost::asio::ip::address_v4 dst;
    std::uint8_t dstLen = 0;
    std::string iface;
    boost::asio::ip::address_v4 gateway;
    std::uint8_t protocol = 0;
    std::uint32_t table = 0;
};

/// \brief Routes keyed by destination address.
using RouteMap = std::unordered_map<std::string, Route>;

/// \brief Routing table shared between the tick loop and the preflight checks
/// of live targets. Targets outlive the tick that created them, so checks
/// always consult the most recent table.
class RouteTable
{
public:
    RouteTable() = default;
    explicit RouteTable(RouteMap routes)
        : routes(std::make_shared<const RouteMap>(std::move(routes)))
    {}

    void update(RouteMap newRoutes)
    {
        auto ptr = std::make_shared<const RouteMap>(std::move(newRoutes));
        std::lock_guard lock(mutex);
        routes = std::move(ptr);
    }

    bool contains(const std::string& dst) const
    {
        std::lock_guard lock(mutex);
        return routes && routes->contains(dst);
    }

    std::size_t size() const
    {
        std::lock_guard lock(mutex);
        return routes ? routes->size() : 0;
    }

private:
    mutable std::mutex mutex;
    std::shared_ptr<const RouteMap> routes;
};

class RouteSource
{
public:
    virtual ~RouteSource() = default;
    /// \brief Get kernel routes installed by BGP keyed by destination.
    virtual Maybe<RouteMap> getBgpRoutesByDst(const Context& ctx) = 0;
};

} // namespace gmon
