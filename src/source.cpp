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

#include "gmon/source.hpp"
#include "gmon/details/json.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <re2/re2.h>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <unordered_map>


namespace gmon {

static constexpr auto COMMAND_POLL_INTERVAL = std::chrono::milliseconds(50);

std::string metroName(std::string_view code)
{
    static const std::unordered_map<std::string_view, std::string_view> names = {
        {"auh", "Abu Dhabi"},
        {"ams", "Amsterdam"},
        {"atl", "Atlanta"},
        {"blr", "Bangalore"},
        {"bom", "Mumbai"},
        {"cpt", "Cape Town"},
        {"fra", "Frankfurt"},
        {"hkg", "Hong Kong"},
        {"lon", "London"},
        {"nyc", "New York"},
        {"sao", "São Paulo"},
        {"sfo", "San Francisco"},
        {"sgp", "Singapore"},
        {"syd", "Sydney"},
        {"tpe", "Taipei"},
        {"tyo", "Tokyo"},
        {"tor", "Toronto"},
    };
    if (auto i = names.find(code); i != names.end())
        return std::string(i->second);
    return std::string(code);
}

/////////////////////////
// CommandStatusSource //
/////////////////////////

Maybe<std::vector<OverlayStatus>> CommandStatusSource::status(const Context& ctx)
{
    namespace bp = boost::process;
    if (auto ec = ctx.err(); ec) return Error(ec);

    boost::asio::io_context ioCtx;
    std::future<std::string> output;
    bp::group group;
    std::error_code ec;
    bp::child child(bp::search_path("sh"), "-c", command,
        bp::std_in < bp::null, bp::std_out > output, bp::std_err > bp::null,
        group, ioCtx, ec);
    if (ec) {
        spdlog::error("source: can't run '{}': {}", command, fmtError(ec));
        return Error(ErrorCode::CommandFailed);
    }

    // The io context runs out of work once the child closed its output.
    while (!ioCtx.stopped()) {
        auto slice = std::chrono::duration_cast<Context::Clock::duration>(COMMAND_POLL_INTERVAL);
        if (auto left = ctx.remaining(); left) slice = std::min(slice, *left);
        if (ctx.cancelled() || slice <= Context::Clock::duration::zero()) {
            std::error_code termErr;
            group.terminate(termErr);
            if (termErr)
                spdlog::warn("source: can't terminate '{}': {}", command, fmtError(termErr));
            child.wait(termErr);
            spdlog::warn("source: '{}' did not finish in time", command);
            return Error(ctx.cancelled() ? ErrorCode::Cancelled : ErrorCode::DeadlineExceeded);
        }
        ioCtx.run_for(slice);
    }

    child.wait(ec);
    if (ec || child.exit_code() != 0) {
        spdlog::error("source: '{}' failed with status {}", command, child.exit_code());
        return Error(ErrorCode::CommandFailed);
    }
    return Parse(output.get());
}

Maybe<std::vector<OverlayStatus>> CommandStatusSource::Parse(std::string_view json)
{
    auto data = details::parseJson(json);
    if (isError(data)) return propagateError(data);

    auto getString = [] (const boost::json::object& obj, std::string_view key) {
        if (auto value = obj.if_contains(key); value && value->is_string())
            return std::string(value->as_string());
        return std::string();
    };

    std::vector<OverlayStatus> entries;
    try {
        for (auto&& item : data->as_array()) {
            const auto& obj = item.as_object();
            OverlayStatus entry;
            if (auto status = obj.if_contains("doublezero_status"); status && status->is_object()) {
                const auto& st = status->as_object();
                entry.sessionStatus = getString(st, "session_status");
                if (auto update = st.if_contains("last_session_update"); update && update->is_number())
                    entry.lastSessionUpdate = update->to_number<std::int64_t>();
            }
            entry.tunnelName = getString(obj, "tunnel_name");
            entry.tunnelSrc = getString(obj, "tunnel_src");
            entry.tunnelDst = getString(obj, "tunnel_dst");
            entry.doubleZeroIp = getString(obj, "doublezero_ip");
            entry.userType = getString(obj, "user_type");
            entries.push_back(std::move(entry));
        }
    } catch (const std::exception& e) {
        spdlog::error("source: invalid status output: {}", e.what());
        return Error(ErrorCode::InvalidJson);
    }
    return entries;
}

//////////////////
// SourceConfig //
//////////////////

static bool isValidInterfaceName(const std::string& name)
{
    return RE2::FullMatch(name, R"([A-Za-z0-9_.:@\-]{1,15})");
}

void SourceConfig::validate() const
{
    if (publicIface.empty())
        throw std::invalid_argument("public interface is required");
    if (!isValidInterfaceName(publicIface))
        throw std::invalid_argument(fmt::format("invalid interface name: '{}'", publicIface));
    if (!dzIface.empty() && !isValidInterfaceName(dzIface))
        throw std::invalid_argument(fmt::format("invalid interface name: '{}'", dzIface));
    if (!dzIface.empty() && dzIface == publicIface)
        throw std::invalid_argument("public and doublezero interface must be different");
    if (metro.empty())
        throw std::invalid_argument("metro is required");
    if (!RE2::FullMatch(metro, "[a-z]{3}"))
        throw std::invalid_argument(fmt::format("invalid metro code: '{}'", metro));
}

Maybe<boost::asio::ip::address_v4> interfaceIPv4(const std::string& iface)
{
    ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) < 0)
        return Error(std::error_code(errno, std::generic_category()));
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard(addrs, &freeifaddrs);

    for (auto i = addrs; i; i = i->ifa_next) {
        if (!i->ifa_addr || i->ifa_addr->sa_family != AF_INET) continue;
        if (iface != i->ifa_name) continue;
        auto sin = reinterpret_cast<const sockaddr_in*>(i->ifa_addr);
        return boost::asio::ip::address_v4(ntohl(sin->sin_addr.s_addr));
    }
    return Error(ErrorCode::InterfaceNotFound);
}

Maybe<std::string> hostName()
{
    std::array<char, 256> buf = {};
    if (gethostname(buf.data(), buf.size() - 1) < 0)
        return Error(std::error_code(errno, std::generic_category()));
    return std::string(buf.data());
}

////////////////////
// SourceResolver //
////////////////////

SourceResolver::SourceResolver(
    SourceConfig config, std::shared_ptr<StatusSource> status, InterfaceLookup lookup)
    : cfg(std::move(config)), statusSource(std::move(status)), lookup(std::move(lookup))
{
    if (!cfg.dzIface.empty() && !statusSource)
        throw std::invalid_argument("status source is required with a doublezero interface");
    if (!this->lookup)
        throw std::invalid_argument("interface lookup must not be empty");
}

Maybe<Source> SourceResolver::resolve(const Context& ctx, const ProgramData& programData)
{
    Source src;
    src.metro = cfg.metro;
    src.metroName = metroName(cfg.metro);
    src.publicIface = cfg.publicIface;
    src.dzIface = cfg.dzIface;

    if (!cfg.host.empty()) {
        src.host = cfg.host;
    } else {
        auto host = hostName();
        if (isError(host)) {
            spdlog::error("source: can't get host name: {}", fmtError(host.error()));
            return propagateError(host);
        }
        src.host = *host;
    }

    if (cfg.publicIp) {
        src.publicIp = *cfg.publicIp;
    } else {
        auto ip = lookup(cfg.publicIface);
        if (isError(ip)) {
            spdlog::error("source: no IPv4 address on {}: {}", cfg.publicIface, fmtError(ip.error()));
            return propagateError(ip);
        }
        src.publicIp = *ip;
    }

    if (cfg.dzIface.empty()) return src;

    auto entries = statusSource->status(ctx);
    if (isError(entries)) {
        spdlog::error("source: can't get doublezero status: {}", fmtError(entries.error()));
        return propagateError(entries);
    }
    const OverlayStatus* entry = nullptr;
    for (const auto& e : *entries) {
        if (e.tunnelName == cfg.dzIface) {
            entry = &e;
            break;
        }
    }
    if (!entry || !entry->up()) {
        spdlog::error("source: doublezero session on {} is not up ({})", cfg.dzIface,
            entry ? entry->sessionStatus : "no status");
        return Error(ErrorCode::OverlayDown);
    }

    boost::system::error_code ec;
    auto dzIp = boost::asio::ip::make_address_v4(entry->doubleZeroIp, ec);
    if (!ec && !dzIp.is_unspecified()) {
        src.dzIp = dzIp;
    } else {
        auto ip = lookup(cfg.dzIface);
        if (isError(ip)) {
            spdlog::error("source: no IPv4 address on {}: {}", cfg.dzIface, fmtError(ip.error()));
            return propagateError(ip);
        }
        src.dzIp = *ip;
    }

    auto user = programData.usersByDzIp.find(src.dzIp.to_string());
    if (user == programData.usersByDzIp.end()) {
        spdlog::error("source: no doublezero user with IP {}", src.dzIp.to_string());
        return Error(ErrorCode::SourceUserNotFound);
    }
    src.user = user->second;
    return src;
}

} // namespace gmon
