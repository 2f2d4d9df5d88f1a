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

#include "gmon/metrics.hpp"
#include "gmon/probe/quic.hpp"
#include "gmon/source.hpp"

#include <msquic.h>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>


namespace gmon {

/// \brief ALPN Solana validators accept on their TPU QUIC port.
inline constexpr std::string_view SOLANA_TPU_ALPN = "solana-tpu";

/// \brief Error category of MsQuic status codes.
const std::error_category& msquic_error_category();

/// \brief Convert a failed MsQuic status to an error code. Handshake and idle
/// timeouts map to ErrorCode::IdleTimeout.
std::error_code makeQuicError(QUIC_STATUS status);

namespace details {
class MsQuicLibrary;
}

/// \brief QUIC dialer on top of MsQuic.
///
/// Every dial performs a full QUIC handshake (TLS 1.3, ALPN "solana-tpu")
/// from the first IPv4 address of the source interface. Server certificates
/// are not validated; validators present self-signed certificates. Established
/// connections send keep-alive PINGs and close after the idle timeout, so their
/// loss recovery statistics describe the path for as long as the target lives.
class MsQuicDialer : public QuicDialer
{
public:
    /// \param metrics Optional metrics receiving dial outcomes.
    /// \param lookup Resolves the source interface to its local address.
    /// \throws std::runtime_error if MsQuic cannot be initialized.
    explicit MsQuicDialer(Metrics* metrics = nullptr,
        SourceResolver::InterfaceLookup lookup = interfaceIPv4);

    Maybe<QuicConnectionPtr> dial(const Context& ctx, const std::string& iface,
        const std::string& hostPort, const QuicConfig& config) override;

private:
    Metrics* metrics;
    SourceResolver::InterfaceLookup lookup;
    std::shared_ptr<details::MsQuicLibrary> lib;
};

} // namespace gmon
