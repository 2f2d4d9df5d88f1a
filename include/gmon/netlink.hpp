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

#include "gmon/routes.hpp"

extern "C" {
#include <libmnl/libmnl.h>
}

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>


namespace gmon {

/// \brief Reads the kernel IPv4 routing table over an rtnetlink socket.
class NetlinkRouteSource : public RouteSource
{
public:
    NetlinkRouteSource();
    NetlinkRouteSource(const NetlinkRouteSource&) = delete;
    NetlinkRouteSource& operator=(const NetlinkRouteSource&) = delete;
    ~NetlinkRouteSource() { close(); }

    std::error_code open();
    void close();

    /// \brief Dump all IPv4 routes of all tables.
    Maybe<std::vector<Route>> dumpRoutes();

    Maybe<RouteMap> getBgpRoutesByDst(const Context& ctx) override;

    /// \brief Output interface of the IPv4 default route in the main table.
    Maybe<std::string> defaultInterface();

    /// \brief Keep routes installed by BGP, keyed by destination address.
    static RouteMap FilterBgp(const std::vector<Route>& routes);

    /// \brief Parse one buffer of a route dump and append the routes to
    /// `routes`. Returns true once the end of the dump was reached.
    static Maybe<bool> ParseDump(const void* buf, std::size_t len,
        std::uint32_t seq, std::uint32_t portid, std::vector<Route>& routes);

private:
    mnl_socket* nl = nullptr;
    std::uint32_t seq;
};

} // namespace gmon
