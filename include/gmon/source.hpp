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
#include "gmon/serviceability.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace gmon {

/// \brief Vantage point of a tick.
struct Source
{
    std::string host;
    std::string metro;     ///< three letter metro code
    std::string metroName;
    std::string publicIface;
    boost::asio::ip::address_v4 publicIp;
    std::string dzIface;   ///< empty if the host is not on the overlay
    boost::asio::ip::address_v4 dzIp;
    std::optional<User> user; ///< overlay registry entry of this host

    bool onOverlay() const { return !dzIface.empty(); }
};

/// \brief Full name of a metro code. Unknown codes map to themselves.
std::string metroName(std::string_view code);

/// \brief One entry of the overlay daemon status.
struct OverlayStatus
{
    static constexpr std::string_view SESSION_UP = "BGP Session Up";

    std::string sessionStatus;
    std::int64_t lastSessionUpdate = 0;
    std::string tunnelName;
    std::string tunnelSrc;
    std::string tunnelDst;
    std::string doubleZeroIp;
    std::string userType;

    bool up() const { return sessionStatus == SESSION_UP; }
};

class StatusSource
{
public:
    virtual ~StatusSource() = default;
    virtual Maybe<std::vector<OverlayStatus>> status(const Context& ctx) = 0;
};

/// \brief Gets the overlay status by running the client's status command.
class CommandStatusSource : public StatusSource
{
public:
    static constexpr std::string_view DEFAULT_COMMAND = "doublezero status --json";

    explicit CommandStatusSource(std::string command = std::string(DEFAULT_COMMAND))
        : command(std::move(command))
    {}

    Maybe<std::vector<OverlayStatus>> status(const Context& ctx) override;

    /// \brief Parse the JSON output of the status command.
    static Maybe<std::vector<OverlayStatus>> Parse(std::string_view json);

private:
    std::string command;
};

struct SourceConfig
{
    std::string host;        ///< empty selects the system host name
    std::string metro;
    std::string publicIface;
    std::optional<boost::asio::ip::address_v4> publicIp; ///< empty selects the interface address
    std::string dzIface;

    void validate() const;
};

/// \brief Returns the first IPv4 address assigned to an interface.
Maybe<boost::asio::ip::address_v4> interfaceIPv4(const std::string& iface);

/// \brief System host name.
Maybe<std::string> hostName();

/// \brief Builds the Source of a tick from configuration, interface state,
/// overlay status and registry data.
class SourceResolver
{
public:
    using InterfaceLookup = std::function<Maybe<boost::asio::ip::address_v4>(const std::string&)>;

    SourceResolver(SourceConfig config, std::shared_ptr<StatusSource> status,
        InterfaceLookup lookup = interfaceIPv4);

    const SourceConfig& config() const { return cfg; }

    Maybe<Source> resolve(const Context& ctx, const ProgramData& programData);

private:
    SourceConfig cfg;
    std::shared_ptr<StatusSource> statusSource;
    InterfaceLookup lookup;
};

} // namespace gmon
