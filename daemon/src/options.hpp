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

#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


extern const char* DEFAULT_CONFIG_PATH;

struct Options
{
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool verbose = false;
    bool verboseFailures = false;
    bool verboseSuccesses = false;

    // Probing
    std::chrono::nanoseconds probeInterval = std::chrono::seconds(60);
    std::chrono::nanoseconds probeTimeout = std::chrono::seconds(8);
    std::chrono::nanoseconds keepAlivePeriod = std::chrono::seconds(1);
    std::chrono::nanoseconds maxIdleTimeout = std::chrono::seconds(5);
    std::chrono::nanoseconds handshakeIdleTimeout = std::chrono::seconds(2);
    std::filesystem::path quicCertFile; ///< client certificate (PEM), empty for none
    std::filesystem::path quicKeyFile;
    std::size_t maxConcurrency = 128;
    int icmpCount = 3;
    std::chrono::nanoseconds icmpInterval = std::chrono::seconds(1);
    std::size_t icmpSize = 24;

    // Vantage point
    std::string publicIface; ///< empty selects the interface of the default route
    std::string publicIp;    ///< empty selects the interface address
    std::string dzIface;
    std::string sourceMetro;
    std::string sourceHost;
    std::string statusCommand = "doublezero status --json";

    // Data
    std::filesystem::path solanaSnapshot;
    std::filesystem::path serviceabilitySnapshot;
    std::filesystem::path geoipTable;

    // Output
    std::string metricsAddr = "0.0.0.0:8080"; ///< empty disables the metrics server
    std::string output;      ///< line protocol file, "-" for stdout, empty to disable
};

/// \brief Parse a duration like "1m30s", "500ms" or "2.5s". Accepted units are
/// ns, us, ms, s, m and h.
gmon::Maybe<std::chrono::nanoseconds> parseDuration(std::string_view str);

std::optional<bool> parseBool(std::string_view str);

std::optional<spdlog::level::level_enum> logLevelFromString(std::string_view str);

/// \brief Set option `key` (as used in the TOML file) from its string
/// representation.
/// \return Empty string on success, otherwise a description of the accepted
/// values.
std::string setOption(Options& opts, std::string_view key, std::string_view value);

/// \brief Environment variable corresponding to a configuration key.
std::string envName(std::string_view key);

/// \brief Names of all configuration keys.
const std::vector<std::string_view>& optionKeys();

/// \brief Load options from a TOML configuration file. Invalid values are
/// reported and ignored.
/// \return False if the file could not be parsed.
bool loadTomlConfig(const std::filesystem::path& path, Options& opts);

/// \brief Load options in order of increasing precedence from the default
/// configuration file, the file in GMON_CONFIG or `configFile` if given, the
/// GMON_* environment variables and finally `overrides` (from the command
/// line).
void loadOptions(Options& opts, const std::filesystem::path& configFile,
    const std::map<std::string, std::string>& overrides);
