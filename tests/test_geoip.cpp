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

#include "gmon/geoip.hpp"

#include <gtest/gtest.h>

using boost::asio::ip::make_address_v4;


TEST(PrefixGeoIpResolver, LongestPrefixMatch)
{
    using namespace gmon;
    PrefixGeoIpResolver resolver;
    resolver.add({make_address_v4("0.0.0.0"), 0, GeoRecord{.country = "any"}});
    resolver.add({make_address_v4("10.1.2.3"), 16, GeoRecord{.country = "wide"}});
    resolver.add({make_address_v4("10.1.2.0"), 24, GeoRecord{.country = "narrow"}});
    EXPECT_EQ(resolver.size(), 3);

    EXPECT_EQ(resolver.resolve(make_address_v4("10.1.2.200"))->country, "narrow");
    EXPECT_EQ(resolver.resolve(make_address_v4("10.1.3.1"))->country, "wide");
    EXPECT_EQ(resolver.resolve(make_address_v4("8.8.8.8"))->country, "any");
}

TEST(PrefixGeoIpResolver, NoMatch)
{
    using namespace gmon;
    PrefixGeoIpResolver resolver({
        {make_address_v4("192.0.2.0"), 24, GeoRecord{.country = "doc"}},
    });
    EXPECT_FALSE(resolver.resolve(make_address_v4("192.0.3.1")).has_value());
    EXPECT_FALSE(NullGeoIpResolver().resolve(make_address_v4("192.0.2.1")).has_value());
}

TEST(PrefixGeoIpResolver, LoadJsonFile)
{
    using namespace gmon;
    auto resolver = PrefixGeoIpResolver::LoadJsonFile(GMON_TEST_DATA "/geoip.json");
    ASSERT_TRUE(resolver.has_value());
    // the invalid network is skipped
    EXPECT_EQ(resolver->size(), 3);

    auto ams = resolver->resolve(make_address_v4("192.0.2.10"));
    ASSERT_TRUE(ams.has_value());
    EXPECT_EQ(ams->country, "Netherlands");
    EXPECT_EQ(ams->countryCode, "NL");
    EXPECT_EQ(ams->region, "North Holland");
    EXPECT_EQ(ams->cityId, 2759794);
    EXPECT_EQ(ams->metroName, "Amsterdam");
    EXPECT_EQ(ams->asn, 64496);
    EXPECT_EQ(ams->asnOrg, "Example AMS");
    EXPECT_DOUBLE_EQ(ams->latitude, 52.37);

    EXPECT_EQ(resolver->resolve(make_address_v4("192.0.2.200"))->countryCode, "DE");
    EXPECT_EQ(resolver->resolve(make_address_v4("203.0.113.1"))->country, "Unknown");

    auto missing = PrefixGeoIpResolver::LoadJsonFile(GMON_TEST_DATA "/nope.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ErrorCode::FileNotFound);
}
