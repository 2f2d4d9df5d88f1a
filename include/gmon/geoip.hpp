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

#include "gmon/error_codes.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>


namespace gmon {

struct GeoRecord
{
    std::string country;
    std::string countryCode;
    std::string region;
    std::string city;
    int cityId = 0;
    std::string metroName;
    std::uint32_t asn = 0;
    std::string asnOrg;
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const GeoRecord&) const = default;
};

class GeoIpResolver
{
public:
    virtual ~GeoIpResolver() = default;
    virtual std::optional<GeoRecord> resolve(const boost::asio::ip::address_v4& ip) const = 0;
};

class NullGeoIpResolver : public GeoIpResolver
{
public:
    std::optional<GeoRecord> resolve(const boost::asio::ip::address_v4&) const override
    {
        return std::nullopt;
    }
};

/// \brief Resolves addresses by longest prefix match over a table of IPv4
/// networks.
class PrefixGeoIpResolver : public GeoIpResolver
{
public:
    struct Entry
    {
        boost::asio::ip::address_v4 network;
        unsigned int prefixLen = 0;
        GeoRecord record;
    };

    PrefixGeoIpResolver() = default;
    explicit PrefixGeoIpResolver(std::vector<Entry> entries);

    /// \brief Load a JSON array of objects with a "network" member in CIDR
    /// notation and the record members.
    static Maybe<PrefixGeoIpResolver> LoadJsonFile(const std::filesystem::path& path);

    void add(Entry entry);
    std::size_t size() const { return entries.size(); }

    std::optional<GeoRecord> resolve(const boost::asio::ip::address_v4& ip) const override;

private:
    std::vector<Entry> entries; // sorted by descending prefix length
};

} // namespace gmon
