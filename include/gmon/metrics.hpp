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

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>


namespace gmon {

/// \brief Prometheus metrics of the monitor.
///
/// All families are registered with the registry passed to the constructor,
/// so tests can use a private registry and inspect values.
class Metrics
{
public:
    explicit Metrics(std::shared_ptr<prometheus::Registry> registry
        = std::make_shared<prometheus::Registry>());

    const std::shared_ptr<prometheus::Registry>& getRegistry() const { return registry; }

    void setBuildInfo(const std::string& version, const std::string& commit,
        const std::string& date);

    /// \brief Count the outcome of a tick ("ok" or the step that failed).
    void tick(std::string_view outcome);
    void observeTickDuration(double seconds);

    void probeSuccess(std::string_view kind, std::string_view path, std::string_view type);
    void probeNotReady(std::string_view kind, std::string_view path, std::string_view type);
    void probeFail(std::string_view kind, std::string_view path, std::string_view type,
        std::string_view reason);

    void setTargets(std::size_t n);
    void targetsPruned(std::size_t n);
    void quicDial(std::string_view iface, bool ok);

private:
    std::shared_ptr<prometheus::Registry> registry;

public:
    prometheus::Family<prometheus::Gauge>& buildInfo;
    prometheus::Family<prometheus::Counter>& tickTotal;
    prometheus::Family<prometheus::Histogram>& tickDuration;
    prometheus::Family<prometheus::Counter>& planProbesSuccessTotal;
    prometheus::Family<prometheus::Counter>& planProbesNotReadyTotal;
    prometheus::Family<prometheus::Counter>& planProbesFailTotal;
    prometheus::Family<prometheus::Gauge>& targetsCurrent;
    prometheus::Family<prometheus::Counter>& targetsPrunedTotal;
    prometheus::Family<prometheus::Counter>& tpuquicDialsTotal;
};

} // namespace gmon
