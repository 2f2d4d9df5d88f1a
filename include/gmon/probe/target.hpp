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

#include "gmon/context.hpp"
#include "gmon/error_codes.hpp"
#include "gmon/probe/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>


namespace gmon {

/// \brief Local check run before a probe touches the network. Returns the
/// reason the probe must not run or nothing if the probe may proceed.
using Preflight = std::function<std::optional<FailReason>(const Context&)>;

/// \brief A named, probeable endpoint.
///
/// probe() may be called repeatedly over the lifetime of the target. Protocol
/// resources are only released by close(), after which a subsequent probe()
/// reacquires them.
class ProbeTarget
{
public:
    virtual ~ProbeTarget() = default;

    virtual const ProbeTargetId& id() const = 0;
    virtual ProbeType type() const = 0;
    /// \brief Name of the interface probes are sent from.
    virtual const std::string& iface() const = 0;
    /// \brief Destination as IP address or host:port.
    virtual std::string addr() const = 0;

    /// \brief Run one probe.
    /// \return A result describing success or a classified failure. An error
    /// is only returned for conditions that are not a property of the path,
    /// most importantly cancellation of `ctx`.
    virtual Maybe<ProbeResult> probe(const Context& ctx) = 0;

    virtual void close() = 0;
};

using ProbeTargetPtr = std::shared_ptr<ProbeTarget>;
using TargetMap = std::map<ProbeTargetId, ProbeTargetPtr>;

} // namespace gmon
