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

#include "gmon/metrics.hpp"


namespace gmon {

static const prometheus::Histogram::BucketBoundaries TICK_DURATION_BUCKETS = {
    0.5, 1, 2, 5, 10, 15, 20, 30, 45, 60, 90, 120
};

Metrics::Metrics(std::shared_ptr<prometheus::Registry> reg)
    : registry(std::move(reg))
    , buildInfo(prometheus::BuildGauge()
        .Name("global_monitor_build_info")
        .Help("Build information of the global monitor")
        .Register(*registry))
    , tickTotal(prometheus::BuildCounter()
        .Name("global_monitor_tick_total")
        .Help("Number of runner ticks by outcome")
        .Register(*registry))
    , tickDuration(prometheus::BuildHistogram()
        .Name("global_monitor_tick_duration_seconds")
        .Help("Duration of runner ticks")
        .Register(*registry))
    , planProbesSuccessTotal(prometheus::BuildCounter()
        .Name("global_monitor_plan_probes_success_total")
        .Help("Number of successful probes by plan kind, path and probe type")
        .Register(*registry))
    , planProbesNotReadyTotal(prometheus::BuildCounter()
        .Name("global_monitor_plan_probes_not_ready_total")
        .Help("Number of probes whose statistics were not ready")
        .Register(*registry))
    , planProbesFailTotal(prometheus::BuildCounter()
        .Name("global_monitor_plan_probes_fail_total")
        .Help("Number of failed probes by plan kind, path, probe type and reason")
        .Register(*registry))
    , targetsCurrent(prometheus::BuildGauge()
        .Name("global_monitor_targets_current")
        .Help("Number of live probe targets")
        .Register(*registry))
    , targetsPrunedTotal(prometheus::BuildCounter()
        .Name("global_monitor_targets_pruned_total")
        .Help("Number of probe targets closed by pruning")
        .Register(*registry))
    , tpuquicDialsTotal(prometheus::BuildCounter()
        .Name("global_monitor_tpuquic_dials_total")
        .Help("Number of TPU QUIC dials by interface and result")
        .Register(*registry))
{}

void Metrics::setBuildInfo(const std::string& version, const std::string& commit,
    const std::string& date)
{
    buildInfo.Add({{"version", version}, {"commit", commit}, {"date", date}}).Set(1);
}

void Metrics::tick(std::string_view outcome)
{
    tickTotal.Add({{"outcome", std::string(outcome)}}).Increment();
}

void Metrics::observeTickDuration(double seconds)
{
    tickDuration.Add({}, TICK_DURATION_BUCKETS).Observe(seconds);
}

void Metrics::probeSuccess(std::string_view kind, std::string_view path, std::string_view type)
{
    planProbesSuccessTotal.Add({
        {"kind", std::string(kind)},
        {"path", std::string(path)},
        {"probe_type", std::string(type)},
    }).Increment();
}

void Metrics::probeNotReady(std::string_view kind, std::string_view path, std::string_view type)
{
    planProbesNotReadyTotal.Add({
        {"kind", std::string(kind)},
        {"path", std::string(path)},
        {"probe_type", std::string(type)},
    }).Increment();
}

void Metrics::probeFail(std::string_view kind, std::string_view path, std::string_view type,
    std::string_view reason)
{
    planProbesFailTotal.Add({
        {"kind", std::string(kind)},
        {"path", std::string(path)},
        {"probe_type", std::string(type)},
        {"reason", std::string(reason)},
    }).Increment();
}

void Metrics::setTargets(std::size_t n)
{
    targetsCurrent.Add({}).Set((double)n);
}

void Metrics::targetsPruned(std::size_t n)
{
    targetsPrunedTotal.Add({}).Increment((double)n);
}

void Metrics::quicDial(std::string_view iface, bool ok)
{
    tpuquicDialsTotal.Add({
        {"iface", std::string(iface)},
        {"result", ok ? "ok" : "error"},
    }).Increment();
}

} // namespace gmon
