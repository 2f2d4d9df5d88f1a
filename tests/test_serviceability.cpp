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

#include "fakes.hpp"

#include <gtest/gtest.h>

using boost::asio::ip::make_address_v4;


TEST(ProgramData, Build)
{
    using namespace gmon;
    std::vector<Exchange> exchanges = {
        Exchange{.pubkey = test::key(0xe1), .code = "xams", .name = "Amsterdam"},
    };
    std::vector<Device> devices = {
        Device{.pubkey = test::key(0xd1), .code = "ams-dz01", .exchangePk = test::key(0xe1)},
        Device{.pubkey = test::key(0xd2), .code = "lax-dz01", .exchangePk = test::key(0xe9)},
    };
    std::vector<User> users = {
        User{.pubkey = test::key(0x01), .clientIp = make_address_v4("198.51.100.1"),
            .dzIp = make_address_v4("10.0.0.1"), .devicePk = test::key(0xd1)},
        User{.pubkey = test::key(0x02), .clientIp = make_address_v4("198.51.100.2"),
            .devicePk = test::key(0xd2)},
        User{.pubkey = test::key(0x03), .devicePk = test::key(0xd9)},
    };

    auto data = ProgramData::Build(exchanges, devices, users);
    EXPECT_EQ(data.usersByPk.size(), 3);
    EXPECT_EQ(data.usersByDzIp.size(), 1);
    EXPECT_EQ(data.usersByClientIp.size(), 2);
    EXPECT_EQ(data.devicesByPk.size(), 2);

    EXPECT_EQ(data.usersByDzIp.at("10.0.0.1").exchangeCode(), "xams");
    EXPECT_EQ(data.usersByDzIp.at("10.0.0.1").device->code, "ams-dz01");
    // device with unknown exchange
    EXPECT_TRUE(data.usersByPk.at(test::key(0x02)).device.has_value());
    EXPECT_EQ(data.usersByPk.at(test::key(0x02)).exchangeCode(), "");
    // unknown device
    EXPECT_FALSE(data.usersByPk.at(test::key(0x03)).device.has_value());
}

TEST(ProgramData, UserTypes)
{
    using namespace gmon;
    for (auto type : {UserType::IBRL, UserType::IBRLWithAllocatedIP,
        UserType::EdgeFiltering, UserType::Multicast})
    {
        EXPECT_EQ(userTypeFromString(toString(type)), type);
    }
    EXPECT_EQ(userTypeFromString("Something"), UserType::Unknown);
}
