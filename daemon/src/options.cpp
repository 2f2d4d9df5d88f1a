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

#include "options.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>
#include <re2/re2.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <functional>


const char* DEFAULT_CONFIG_PATH = "/etc/global-monitor/config.toml";

static std::string _getenv(const char* var)
{
    // FIXME: getenv is not thread-safe
    const char* value = std::getenv(var);
    if (value) return value;
    else return std::string();
}

gmon::Maybe<std::chrono::nanoseconds> parseDuration(std::string_view str)
{
    using namespace std::chrono;
    if (str.empty()) return gmon::Error(gmon::ErrorCode::InvalidArgument);
    if (str == "0") return nanoseconds::zero();

    double total = 0.0; // nanoseconds
    auto p = str.data();
    const auto end = str.data() + str.size();
    while (p < end) {
        if (!std::isdigit((unsigned char)*p) && *p != '.')
            return gmon::Error(gmon::ErrorCode::InvalidArgument);
        double value = 0.0;
        auto [next, ec] = std::from_chars(p, end, value, std::chars_format::fixed);
        if (ec != std::errc() || next == p)
            return gmon::Error(gmon::ErrorCode::InvalidArgument);
        p = next;
        auto unitBegin = p;
        while (p < end && !std::isdigit((unsigned char)*p) && *p != '.') ++p;
        std::string_view unit(unitBegin, p - unitBegin);
        if (unit == "ns")
            total += value;
        else if (unit == "us" || unit == "\xC2\xB5s")
            total += value * 1e3;
        else if (unit == "ms")
            total += value * 1e6;
        else if (unit == "s")
            total += value * 1e9;
        else if (unit == "m")
            total += value * 60e9;
        else if (unit == "h")
            total += value * 3600e9;
        else
            return gmon::Error(gmon::ErrorCode::InvalidArgument);
    }
    return nanoseconds((std::int64_t)total);
}

std::optional<bool> parseBool(std::string_view str)
{
    if (str == "true" || str == "yes" || str == "on" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "off" || str == "0")
        return false;
    else
        return std::nullopt;
}

std::optional<spdlog::level::level_enum> logLevelFromString(std::string_view str)
{
    if (str == "trace")
        return spdlog::level::trace;
    else if (str == "debug")
        return spdlog::level::debug;
    else if (str == "info")
        return spdlog::level::info;
    else if (str == "warn")
        return spdlog::level::warn;
    else if (str == "error")
        return spdlog::level::err;
    else if (str == "critical")
        return spdlog::level::critical;
    else
        return std::nullopt;
}

template <typename T>
static std::optional<T> parseUnsigned(std::string_view str)
{
    T value = 0;
    auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || p != str.data() + str.size()) return std::nullopt;
    return value;
}

static bool isInterfaceName(std::string_view str)
{
    return RE2::FullMatch(str, R"([A-Za-z0-9_.:@\-]{1,15})");
}

using Setter = std::function<std::string(Options&, std::string_view)>;

static Setter durationSetter(std::chrono::nanoseconds Options::*member)
{
    return [member] (Options& opts, std::string_view value) -> std::string {
        auto d = parseDuration(value);
        if (gmon::isError(d) || *d <= std::chrono::nanoseconds::zero())
            return "must be a positive duration like 30s, 1m or 500ms";
        opts.*member = *d;
        return {};
    };
}

static Setter boolSetter(bool Options::*member)
{
    return [member] (Options& opts, std::string_view value) -> std::string {
        auto b = parseBool(value);
        if (!b) return "should be one of true, false";
        opts.*member = *b;
        return {};
    };
}

static Setter stringSetter(std::string Options::*member)
{
    return [member] (Options& opts, std::string_view value) -> std::string {
        opts.*member = std::string(value);
        return {};
    };
}

static Setter pathSetter(std::filesystem::path Options::*member)
{
    return [member] (Options& opts, std::string_view value) -> std::string {
        opts.*member = std::filesystem::path(value);
        return {};
    };
}

static Setter ifaceSetter(std::string Options::*member)
{
    return [member] (Options& opts, std::string_view value) -> std::string {
        if (!value.empty() && !isInterfaceName(value))
            return "must be a valid interface name";
        opts.*member = std::string(value);
        return {};
    };
}

static const std::map<std::string_view, Setter>& setters()
{
    static const std::map<std::string_view, Setter> table = {
        {"log_level", [] (Options& opts, std::string_view value) -> std::string {
            auto level = logLevelFromString(value);
            if (!level) return "should be one of trace, debug, info, warn, error, critical";
            opts.logLevel = *level;
            return {};
        }},
        {"verbose", boolSetter(&Options::verbose)},
        {"verbose_failures", boolSetter(&Options::verboseFailures)},
        {"verbose_successes", boolSetter(&Options::verboseSuccesses)},
        {"probe_interval", durationSetter(&Options::probeInterval)},
        {"probe_timeout", durationSetter(&Options::probeTimeout)},
        {"keep_alive_period", durationSetter(&Options::keepAlivePeriod)},
        {"max_idle_timeout", durationSetter(&Options::maxIdleTimeout)},
        {"handshake_idle_timeout", durationSetter(&Options::handshakeIdleTimeout)},
        {"quic_cert_file", pathSetter(&Options::quicCertFile)},
        {"quic_key_file", pathSetter(&Options::quicKeyFile)},
        {"max_concurrency", [] (Options& opts, std::string_view value) -> std::string {
            auto n = parseUnsigned<std::size_t>(value);
            if (!n || *n == 0) return "must be a positive integer";
            opts.maxConcurrency = *n;
            return {};
        }},
        {"icmp_count", [] (Options& opts, std::string_view value) -> std::string {
            auto n = parseUnsigned<int>(value);
            if (!n || *n <= 0) return "must be a positive integer";
            opts.icmpCount = *n;
            return {};
        }},
        {"icmp_interval", durationSetter(&Options::icmpInterval)},
        {"icmp_size", [] (Options& opts, std::string_view value) -> std::string {
            auto n = parseUnsigned<std::size_t>(value);
            if (!n || *n > 65507 - 8) return "must be a payload size in bytes";
            opts.icmpSize = *n;
            return {};
        }},
        {"public_iface", ifaceSetter(&Options::publicIface)},
        {"public_ip", [] (Options& opts, std::string_view value) -> std::string {
            if (!value.empty() && !RE2::FullMatch(value, R"((\d{1,3}\.){3}\d{1,3})"))
                return "must be an IPv4 address";
            opts.publicIp = std::string(value);
            return {};
        }},
        {"dz_iface", ifaceSetter(&Options::dzIface)},
        {"source_metro", [] (Options& opts, std::string_view value) -> std::string {
            if (!RE2::FullMatch(value, "[a-z]{3}"))
                return "must be a three letter metro code like ams or nyc";
            opts.sourceMetro = std::string(value);
            return {};
        }},
        {"source_host", stringSetter(&Options::sourceHost)},
        {"status_command", stringSetter(&Options::statusCommand)},
        {"solana_snapshot", pathSetter(&Options::solanaSnapshot)},
        {"serviceability_snapshot", pathSetter(&Options::serviceabilitySnapshot)},
        {"geoip_table", pathSetter(&Options::geoipTable)},
        {"metrics_addr", [] (Options& opts, std::string_view value) -> std::string {
            if (!value.empty() && !RE2::FullMatch(value, R"([^:\s]*:\d{1,5})"))
                return "must be an address like 0.0.0.0:8080";
            opts.metricsAddr = std::string(value);
            return {};
        }},
        {"output", stringSetter(&Options::output)},
    };
    return table;
}

std::string setOption(Options& opts, std::string_view key, std::string_view value)
{
    auto i = setters().find(key);
    if (i == setters().end()) return "unknown option";
    return i->second(opts, value);
}

std::string envName(std::string_view key)
{
    std::string name = "GMON_";
    std::transform(key.begin(), key.end(), std::back_inserter(name), [] (char c) {
        return (char)std::toupper((unsigned char)c);
    });
    return name;
}

const std::vector<std::string_view>& optionKeys()
{
    static const std::vector<std::string_view> keys = [] {
        std::vector<std::string_view> keys;
        for (auto&& [key, _] : setters()) keys.push_back(key);
        return keys;
    }();
    return keys;
}

static std::optional<std::string> tomlValueToString(const toml::node& node)
{
    if (auto str = node.as_string(); str)
        return str->get();
    if (auto i = node.as_integer(); i)
        return std::to_string(i->get());
    if (auto b = node.as_boolean(); b)
        return b->get() ? "true" : "false";
    return std::nullopt;
}

bool loadTomlConfig(const std::filesystem::path& path, Options& opts)
{
    auto res = toml::parse_file(path.string());
    if (res.failed()) {
        auto& begin = res.error().source().begin;
        spdlog::warn("Failed to load ({}:{}:{}): {}",
            path.string(), begin.line, begin.column, res.error().description());
        return false;
    }
    auto& tbl = res.table();
    for (auto&& [key, node] : tbl) {
        auto& begin = node.source().begin;
        auto value = tomlValueToString(node);
        if (!value) {
            spdlog::warn("Invalid value for {} ({}:{}:{}): unsupported type",
                key.str(), path.string(), begin.line, begin.column);
            continue;
        }
        if (auto err = setOption(opts, key.str(), *value); !err.empty()) {
            spdlog::warn("Invalid value for {} ({}:{}:{}): {} ({})",
                key.str(), path.string(), begin.line, begin.column, *value, err);
        }
    }
    return true;
}

void loadOptions(Options& opts, const std::filesystem::path& configFile,
    const std::map<std::string, std::string>& overrides)
{
    // Load config files
    std::error_code ec;
    if (std::filesystem::exists(DEFAULT_CONFIG_PATH, ec))
        loadTomlConfig(DEFAULT_CONFIG_PATH, opts);
    if (!configFile.empty()) {
        loadTomlConfig(configFile, opts);
    } else if (auto path = _getenv("GMON_CONFIG"); !path.empty()) {
        loadTomlConfig(path, opts);
    }

    // Environment variables override the configuration files
    for (auto key : optionKeys()) {
        auto name = envName(key);
        if (auto value = _getenv(name.c_str()); !value.empty()) {
            if (auto err = setOption(opts, key, value); !err.empty())
                spdlog::warn("Invalid value for {}: {} ({})", name, value, err);
        }
    }

    // Command line has the highest precedence
    for (auto&& [key, value] : overrides) {
        if (auto err = setOption(opts, key, value); !err.empty())
            spdlog::warn("Invalid value for --{}: {} ({})", key, value, err);
    }
}
