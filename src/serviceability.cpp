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

#include "gmon/serviceability.hpp"


namespace gmon {

UserType userTypeFromString(std::string_view str)
{
    if (str == "IBRL")
        return UserType::IBRL;
    else if (str == "IBRLWithAllocatedIP")
        return UserType::IBRLWithAllocatedIP;
    else if (str == "EdgeFiltering")
        return UserType::EdgeFiltering;
    else if (str == "Multicast")
        return UserType::Multicast;
    else
        return UserType::Unknown;
}

ProgramData ProgramData::Build(const std::vector<Exchange>& exchanges,
    const std::vector<Device>& devices, const std::vector<User>& users)
{
    ProgramData data;
    for (const auto& ex : exchanges) {
        data.exchangesByPk[ex.pubkey] = ex;
    }
    for (auto dev : devices) {
        if (auto i = data.exchangesByPk.find(dev.exchangePk); i != data.exchangesByPk.end())
            dev.exchange = i->second;
        data.devicesByCode[dev.code] = dev;
        data.devicesByPk[dev.pubkey] = std::move(dev);
    }
    for (auto user : users) {
        if (auto i = data.devicesByPk.find(user.devicePk); i != data.devicesByPk.end())
            user.device = i->second;
        if (!user.dzIp.is_unspecified())
            data.usersByDzIp[user.dzIp.to_string()] = user;
        if (!user.clientIp.is_unspecified())
            data.usersByClientIp[user.clientIp.to_string()] = user;
        data.usersByPk[user.pubkey] = std::move(user);
    }
    return data;
}

} // namespace gmon
