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

#include "gmon/netlink.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <linux/rtnetlink.h>
#include <net/if.h>

#include <cerrno>
#include <ctime>
#include <memory>


namespace gmon {

static int parseRouteAttr(const nlattr* attr, void* data)
{
    auto tb = reinterpret_cast<const nlattr**>(data);
    auto type = mnl_attr_get_type(attr);
    if (mnl_attr_type_valid(attr, RTA_MAX) < 0) return MNL_CB_OK;
    switch (type) {
    case RTA_DST:
    case RTA_GATEWAY:
    case RTA_OIF:
    case RTA_TABLE:
        if (mnl_attr_validate(attr, MNL_TYPE_U32) < 0) return MNL_CB_ERROR;
        break;
    default:
        break;
    }
    tb[type] = attr;
    return MNL_CB_OK;
}

static int parseRoute(const nlmsghdr* nlh, void* data)
{
    auto routes = reinterpret_cast<std::vector<Route>*>(data);
    if (mnl_nlmsg_get_payload_len(nlh) < sizeof(rtmsg)) return MNL_CB_ERROR;
    auto rtm = reinterpret_cast<const rtmsg*>(mnl_nlmsg_get_payload(nlh));
    if (rtm->rtm_family != AF_INET) return MNL_CB_OK;

    const nlattr* tb[RTA_MAX + 1] = {};
    if (mnl_attr_parse(nlh, sizeof(rtmsg), parseRouteAttr, tb) < 0)
        return MNL_CB_ERROR;

    Route route;
    route.dstLen = rtm->rtm_dst_len;
    route.protocol = rtm->rtm_protocol;
    route.table = rtm->rtm_table;
    if (tb[RTA_TABLE]) route.table = mnl_attr_get_u32(tb[RTA_TABLE]);
    // addresses are in network byte order
    if (tb[RTA_DST])
        route.dst = boost::asio::ip::address_v4(ntohl(mnl_attr_get_u32(tb[RTA_DST])));
    if (tb[RTA_GATEWAY])
        route.gateway = boost::asio::ip::address_v4(ntohl(mnl_attr_get_u32(tb[RTA_GATEWAY])));
    if (tb[RTA_OIF]) {
        char name[IF_NAMESIZE] = {};
        if (if_indextoname(mnl_attr_get_u32(tb[RTA_OIF]), name))
            route.iface = name;
    }
    routes->push_back(std::move(route));
    return MNL_CB_OK;
}

NetlinkRouteSource::NetlinkRouteSource()
    : seq((std::uint32_t)time(NULL))
{}

std::error_code NetlinkRouteSource::open()
{
    nl = mnl_socket_open(NETLINK_ROUTE);
    if (!nl) return ErrorCode::SocketClosed;
    if (mnl_socket_bind(nl, 0, MNL_SOCKET_AUTOPID) < 0) {
        auto ec = std::error_code(errno, std::generic_category());
        mnl_socket_close(nl);
        nl = nullptr;
        return ec;
    }
    return ErrorCode::Ok;
}

void NetlinkRouteSource::close()
{
    if (nl) mnl_socket_close(nl);
    nl = nullptr;
}

Maybe<std::vector<Route>> NetlinkRouteSource::dumpRoutes()
{
    if (!nl) return Error(ErrorCode::SocketClosed);
    std::size_t bufsize = MNL_SOCKET_BUFFER_SIZE;
    auto buf = std::make_unique<char[]>(bufsize);

    auto nlh = mnl_nlmsg_put_header(buf.get());
    nlh->nlmsg_type = RTM_GETROUTE;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    nlh->nlmsg_seq = seq++;
    auto rtm = (rtmsg*)mnl_nlmsg_put_extra_header(nlh, sizeof(rtmsg));
    rtm->rtm_family = AF_INET;

    auto portid = mnl_socket_get_portid(nl);
    auto reqSeq = nlh->nlmsg_seq;
    if (mnl_socket_sendto(nl, nlh, nlh->nlmsg_len) < 0)
        return Error(std::error_code(errno, std::generic_category()));

    std::vector<Route> routes;
    while (true) {
        auto numbytes = mnl_socket_recvfrom(nl, buf.get(), bufsize);
        if (numbytes < 0)
            return Error(std::error_code(errno, std::generic_category()));
        auto done = ParseDump(buf.get(), (std::size_t)numbytes, reqSeq, portid, routes);
        if (isError(done)) return propagateError(done);
        if (*done) break;
    }
    return routes;
}

Maybe<bool> NetlinkRouteSource::ParseDump(const void* buf, std::size_t len,
    std::uint32_t seq, std::uint32_t portid, std::vector<Route>& routes)
{
    errno = 0;
    auto ret = mnl_cb_run(buf, len, seq, portid, parseRoute, &routes);
    if (ret < 0) {
        // Malformed messages rejected by parseRoute leave errno untouched.
        if (errno == 0) return Error(ErrorCode::InvalidArgument);
        return Error(std::error_code(errno, std::generic_category()));
    }
    return ret == MNL_CB_STOP;
}

Maybe<RouteMap> NetlinkRouteSource::getBgpRoutesByDst(const Context& ctx)
{
    if (ctx.cancelled()) return Error(ErrorCode::Cancelled);
    if (!nl) {
        if (auto ec = open(); ec) {
            spdlog::error("routes: can't open netlink socket: {}", fmtError(ec));
            return Error(ec);
        }
    }
    auto routes = dumpRoutes();
    if (isError(routes)) {
        spdlog::error("routes: dump failed: {}", fmtError(routes.error()));
        close();
        return propagateError(routes);
    }
    return FilterBgp(*routes);
}

Maybe<std::string> NetlinkRouteSource::defaultInterface()
{
    if (!nl) {
        if (auto ec = open(); ec) return Error(ec);
    }
    auto routes = dumpRoutes();
    if (isError(routes)) return propagateError(routes);
    for (const auto& route : *routes) {
        if (route.dstLen == 0 && route.table == RT_TABLE_MAIN && !route.iface.empty())
            return route.iface;
    }
    return Error(ErrorCode::InterfaceNotFound);
}

RouteMap NetlinkRouteSource::FilterBgp(const std::vector<Route>& routes)
{
    RouteMap result;
    for (const auto& route : routes) {
        if (route.protocol != RTPROT_BGP) continue;
        result[route.dst.to_string()] = route;
    }
    return result;
}

} // namespace gmon
