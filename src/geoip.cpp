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
#include "gmon/details/json.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <string_view>


namespace gmon {

static std::uint32_t prefixMask(unsigned int len)
{
    if (len == 0) return 0;
    return ~std::uint32_t(0) << (32 - len);
}

static bool parseCidr(std::string_view str, PrefixGeoIpResolver::Entry& entry)
{
    auto slash = str.find('/');
    if (slash == str.npos) return false;
    boost::system::error_code ec;
    auto network = boost::asio::ip::make_address_v4(std::string(str.substr(0, slash)), ec);
    if (ec) return false;
    unsigned int len = 0;
    auto lenStr = str.substr(slash + 1);
    auto res = std::from_chars(lenStr.data(), lenStr.data() + lenStr.size(), len);
    if (res.ec != std::errc() || res.ptr != lenStr.data() + lenStr.size() || len > 32)
        return false;
    entry.network = boost::asio::ip::address_v4(network.to_uint() & prefixMask(len));
    entry.prefixLen = len;
    return true;
}

static std::string getString(const boost::json::object& obj, std::string_view key)
{
    if (auto value = obj.if_contains(key); value && value->is_string())
        return std::string(value->as_string());
    return {};
}

static double getNumber(const boost::json::object& obj, std::string_view key)
{
    if (auto value = obj.if_contains(key); value && value->is_number())
        return value->to_number<double>();
    return 0.0;
}

PrefixGeoIpResolver::PrefixGeoIpResolver(std::vector<Entry> entries)
{
    for (auto& entry : entries) add(std::move(entry));
}

Maybe<PrefixGeoIpResolver> PrefixGeoIpResolver::LoadJsonFile(const std::filesystem::path& path)
{
    auto data = details::loadJsonFile(path);
    if (isError(data)) return propagateError(data);

    PrefixGeoIpResolver resolver;
    try {
        for (auto&& item : data->as_array()) {
            const auto& obj = item.as_object();
            Entry entry;
            if (!parseCidr(std::string_view(obj.at("network").as_string()), entry)) {
                spdlog::warn("geoip: invalid network {}", boost::json::serialize(obj.at("network")));
                continue;
            }
            entry.record.country = getString(obj, "country");
            entry.record.countryCode = getString(obj, "country_code");
            entry.record.region = getString(obj, "region");
            entry.record.city = getString(obj, "city");
            entry.record.cityId = (int)getNumber(obj, "city_id");
            entry.record.metroName = getString(obj, "metro");
            entry.record.asn = (std::uint32_t)getNumber(obj, "asn");
            entry.record.asnOrg = getString(obj, "asn_org");
            entry.record.latitude = getNumber(obj, "latitude");
            entry.record.longitude = getNumber(obj, "longitude");
            resolver.add(std::move(entry));
        }
    } catch (const std::exception& e) {
        spdlog::error("geoip: {}: {}", path.string(), e.what());
        return Error(ErrorCode::InvalidJson);
    }
    return resolver;
}

void PrefixGeoIpResolver::add(Entry entry)
{
    entry.network = boost::asio::ip::address_v4(
        entry.network.to_uint() & prefixMask(entry.prefixLen));
    auto pos = std::upper_bound(entries.begin(), entries.end(), entry.prefixLen,
        [] (unsigned int len, const Entry& e) {
            return len > e.prefixLen;
        });
    entries.insert(pos, std::move(entry));
}

std::optional<GeoRecord> PrefixGeoIpResolver::resolve(const boost::asio::ip::address_v4& ip) const
{
    auto addr = ip.to_uint();
    for (const auto& entry : entries) {
        if ((addr & prefixMask(entry.prefixLen)) == entry.network.to_uint())
            return entry.record;
    }
    return std::nullopt;
}

} // namespace gmon
