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

#include "gmon/geoip.hpp"
#include "gmon/json_views.hpp"
#include "gmon/metrics.hpp"
#include "gmon/netlink.hpp"
#include "gmon/planner/dz_user_icmp.hpp"
#include "gmon/planner/sol_val_icmp.hpp"
#include "gmon/planner/sol_val_tpuquic.hpp"
#include "gmon/probe/asio_pinger.hpp"
#include "gmon/probe/msquic_dialer.hpp"
#include "gmon/runner.hpp"
#include "gmon/sink.hpp"
#include "gmon/source.hpp"

#include <boost/asio.hpp>
#include <CLI/CLI.hpp>
#include <prometheus/exposer.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <signal.h>

#ifndef GMON_VERSION
#define GMON_VERSION "dev"
#endif
#ifndef GMON_COMMIT
#define GMON_COMMIT "none"
#endif
#ifndef GMON_DATE
#define GMON_DATE "unknown"
#endif

namespace asio = boost::asio;
using namespace gmon;


static std::string flagName(std::string_view key)
{
    std::string name = "--";
    std::replace_copy(key.begin(), key.end(), std::back_inserter(name), '_', '-');
    return name;
}

static std::shared_ptr<const GeoIpResolver> makeGeoIpResolver(const Options& opts)
{
    if (opts.geoipTable.empty()) {
        spdlog::info("No GeoIP table configured");
        return std::make_shared<NullGeoIpResolver>();
    }
    auto table = PrefixGeoIpResolver::LoadJsonFile(opts.geoipTable);
    if (isError(table)) {
        throw std::runtime_error(fmt::format("error loading GeoIP table from '{}': {}",
            opts.geoipTable.string(), fmtError(table.error())));
    }
    spdlog::info("Loaded {} GeoIP networks from {}", table->size(), opts.geoipTable.string());
    return std::make_shared<PrefixGeoIpResolver>(std::move(*table));
}

static std::shared_ptr<PointSink> makeSink(const Options& opts)
{
    if (opts.output.empty())
        return nullptr;
    else if (opts.output == "-")
        return std::make_shared<LineProtocolSink>(std::cout);
    else
        return LineProtocolSink::OpenFile(opts.output);
}

static int runMonitor(const Options& opts)
{
    if (opts.solanaSnapshot.empty())
        throw std::invalid_argument("solana_snapshot is required");
    if (opts.serviceabilitySnapshot.empty())
        throw std::invalid_argument("serviceability_snapshot is required");

    // Metrics
    auto metrics = std::make_shared<Metrics>();
    metrics->setBuildInfo(GMON_VERSION, GMON_COMMIT, GMON_DATE);
    std::unique_ptr<prometheus::Exposer> exposer;
    if (!opts.metricsAddr.empty()) {
        exposer = std::make_unique<prometheus::Exposer>(opts.metricsAddr);
        exposer->RegisterCollectable(metrics->getRegistry());
        spdlog::info("Serving metrics on {}", opts.metricsAddr);
    }

    // Vantage point
    auto routes = std::make_shared<NetlinkRouteSource>();
    SourceConfig sourceCfg{
        .host = opts.sourceHost,
        .metro = opts.sourceMetro,
        .publicIface = opts.publicIface,
        .dzIface = opts.dzIface,
    };
    if (sourceCfg.publicIface.empty()) {
        auto iface = routes->defaultInterface();
        if (isError(iface)) {
            throw std::runtime_error(fmt::format(
                "no public interface configured and no default route: {}",
                fmtError(iface.error())));
        }
        spdlog::info("Using public interface {} of the default route", *iface);
        sourceCfg.publicIface = *iface;
    }
    if (!opts.publicIp.empty()) {
        boost::system::error_code ec;
        auto ip = asio::ip::make_address_v4(opts.publicIp, ec);
        if (ec) throw std::invalid_argument("invalid public_ip: " + opts.publicIp);
        sourceCfg.publicIp = ip;
    }
    auto source = std::make_shared<SourceResolver>(std::move(sourceCfg),
        std::make_shared<CommandStatusSource>(opts.statusCommand));

    // Planners
    auto geoIp = makeGeoIpResolver(opts);
    PlannerOptions plannerOpts{
        .geoIp = geoIp,
        .verboseFailures = opts.verboseFailures,
        .verboseSuccesses = opts.verboseSuccesses,
    };
    IcmpTargetConfig icmpCfg{
        .count = opts.icmpCount,
        .interval = opts.icmpInterval,
        .size = opts.icmpSize,
    };
    QuicTargetConfig quicCfg{
        .quic = QuicConfig{
            .keepAlivePeriod = opts.keepAlivePeriod,
            .maxIdleTimeout = opts.maxIdleTimeout,
            .handshakeIdleTimeout = opts.handshakeIdleTimeout,
            .certFile = opts.quicCertFile.string(),
            .keyFile = opts.quicKeyFile.string(),
        },
    };
    if (opts.quicCertFile.empty() != opts.quicKeyFile.empty())
        throw std::invalid_argument("quic_cert_file and quic_key_file must be set together");
    auto pinger = std::make_shared<AsioPinger>();
    auto dialer = std::make_shared<MsQuicDialer>(metrics.get());

    RunnerConfig cfg{
        .solana = std::make_shared<JsonSolanaView>(opts.solanaSnapshot, geoIp),
        .serviceability = std::make_shared<JsonServiceabilityView>(opts.serviceabilitySnapshot),
        .routes = routes,
        .source = source,
        .planners = {
            std::make_shared<SolValIcmpPlanner>(pinger, icmpCfg, plannerOpts),
            std::make_shared<SolValTpuQuicPlanner>(dialer, quicCfg, plannerOpts),
            std::make_shared<DzUserIcmpPlanner>(pinger, icmpCfg, plannerOpts),
        },
        .sink = makeSink(opts),
        .clock = std::make_shared<SystemClock>(),
        .metrics = metrics,
        .probeInterval = opts.probeInterval,
        .probeTimeout = opts.probeTimeout,
        .maxConcurrency = opts.maxConcurrency,
    };

    Runner runner(std::move(cfg));

    asio::io_context ioCtx;
    asio::signal_set signals(ioCtx, SIGINT, SIGTERM);
    signals.async_wait([&runner] (const boost::system::error_code& ec, int signal) {
        if (ec) {
            spdlog::critical("Signal handler error: {}", ec.message());
        } else if (signal == SIGINT) {
            spdlog::critical("Got SIGINT, stopping...");
        } else {
            spdlog::critical("Got SIGTERM, stopping...");
        }
        runner.stop();
    });

    runner.run();
    ioCtx.run();
    runner.join();
    spdlog::info("Stopped");
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    std::filesystem::path configFile;
    std::map<std::string, std::string> values;
    bool verbose = false, verboseFailures = false, verboseSuccesses = false;

    CLI::App app{"Global monitor for Solana validators and DoubleZero users"};
    app.set_version_flag("--version",
        fmt::format("global-monitor {} (commit {}, built {})", GMON_VERSION, GMON_COMMIT, GMON_DATE));
    app.add_option("-c,--config", configFile, "Configuration file")
        ->envname("GMON_CONFIG");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("--verbose-failures", verboseFailures, "Log every failed probe");
    app.add_flag("--verbose-successes", verboseSuccesses, "Log every successful probe");
    for (auto key : optionKeys()) {
        if (key == "verbose" || key == "verbose_failures" || key == "verbose_successes")
            continue;
        auto& value = values[std::string(key)];
        app.add_option(flagName(key), value,
            fmt::format("Overrides '{}' (environment {})", key, envName(key)));
    }
    CLI11_PARSE(app, argc, argv);

    std::map<std::string, std::string> overrides;
    for (auto&& [key, value] : values) {
        if (app.count(flagName(key)) > 0) overrides[key] = value;
    }
    if (verbose) overrides["verbose"] = "true";
    if (verboseFailures) overrides["verbose_failures"] = "true";
    if (verboseSuccesses) overrides["verbose_successes"] = "true";

    Options opts;
    loadOptions(opts, configFile, overrides);
    spdlog::set_level(opts.verbose ? spdlog::level::debug : opts.logLevel);

    spdlog::info("global-monitor {} (commit {}, built {})", GMON_VERSION, GMON_COMMIT, GMON_DATE);
    try {
        return runMonitor(opts);
    }
    catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
}
