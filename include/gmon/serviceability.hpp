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
#include "gmon/public_key.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace gmon {

enum class UserType
{
    IBRL,
    IBRLWithAllocatedIP,
    EdgeFiltering,
    Multicast,
    Unknown,
};

inline const char* toString(UserType type)
{
    switch (type) {
    case UserType::IBRL:
        return "IBRL";
    case UserType::IBRLWithAllocatedIP:
        return "IBRLWithAllocatedIP";
    case UserType::EdgeFiltering:
        return "EdgeFiltering";
    case UserType::Multicast:
        return "Multicast";
    default:
        return "Unknown";
    }
}

UserType userTypeFromString(std::string_view str);

/// \brief DoubleZero exchange, a metro level point of presence.
struct Exchange
{
    PublicKey pubkey;
    std::string code;
    std::string name;
};

struct Device
{
    PublicKey pubkey;
    std::string code;
    PublicKey exchangePk;
    std::optional<Exchange> exchange; ///< set when the exchange is known
};

struct User
{
    PublicKey pubkey;
    UserType userType = UserType::Unknown;
    boost::asio::ip::address_v4 clientIp; ///< public internet address
    boost::asio::ip::address_v4 dzIp;     ///< overlay address
    PublicKey validatorPk;                ///< zero if the user is not a validator
    PublicKey devicePk;
    std::optional<Device> device;         ///< set when the device is known

    /// \brief Code of the exchange behind the user's device or an empty string.
    std::string exchangeCode() const
    {
        if (device && device->exchange) return device->exchange->code;
        return {};
    }
};

/// \brief Indexed snapshot of the DoubleZero serviceability program.
struct ProgramData
{
    std::map<PublicKey, User> usersByPk;
    std::unordered_map<std::string, User> usersByDzIp;
    std::unordered_map<std::string, User> usersByClientIp;
    std::map<PublicKey, Device> devicesByPk;
    std::unordered_map<std::string, Device> devicesByCode;
    std::map<PublicKey, Exchange> exchangesByPk;

    /// \brief Link users to devices and devices to exchanges and build all
    /// indices. Users and devices with dangling references are kept without
    /// the link.
    static ProgramData Build(const std::vector<Exchange>& exchanges,
        const std::vector<Device>& devices, const std::vector<User>& users);
};

class ServiceabilityView
{
public:
    virtual ~ServiceabilityView() = default;
    virtual Maybe<ProgramData> getProgramData(const Context& ctx) = 0;
};

} // namespace gmon
