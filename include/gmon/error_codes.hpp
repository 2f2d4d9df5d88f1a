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

#include <fmt/format.h>

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>


namespace gmon {

enum class ErrorCode : int
{
    Ok = 0,
    Cancelled,          ///< Operation was cancelled by its context
    DeadlineExceeded,   ///< Context deadline passed before the operation completed
    IdleTimeout,        ///< No recent network activity on a connection
    NilConnection,      ///< Dialer succeeded but returned no connection
    StatsNotReady,      ///< Protocol statistics have not stabilized
    NoPacketsReceived,  ///< Packets were sent but nothing came back
    InvalidArgument,
    InterfaceNotFound,
    SocketClosed,
    LogicError,
    FileNotFound,
    InvalidJson,
    CommandFailed,
    OverlayDown,        ///< Overlay session of the vantage point is not established
    SourceUserNotFound, ///< Vantage point is not a registered overlay user
    NotInitialized,
};

enum class ErrorCondition : int
{
    Ok = 0,
    Cancelled,
    Timeout,
    InvalidArgument,
    Unavailable,
};

const std::error_category& gmon_error_category();
const std::error_category& gmon_error_condition();

inline std::error_code make_error_code(ErrorCode code)
{
    return {static_cast<int>(code), gmon_error_category()};
}

inline std::error_condition make_error_condition(ErrorCondition cond)
{
    return {static_cast<int>(cond), gmon_error_condition()};
}

template <typename T>
using Maybe = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> Error(std::error_code ec)
{
    return std::unexpected<std::error_code>(ec);
}

inline std::unexpected<std::error_code> Error(ErrorCode code)
{
    return std::unexpected<std::error_code>(make_error_code(code));
}

template <typename T>
inline bool isError(const Maybe<T>& maybe)
{
    return !maybe.has_value();
}

template <typename T>
inline std::unexpected<std::error_code> propagateError(const Maybe<T>& maybe)
{
    return std::unexpected<std::error_code>(maybe.error());
}

/// \brief Format an error code as "<category>:<value> (<message>)".
inline std::string fmtError(std::error_code ec)
{
    return fmt::format("{}:{} ({})", ec.category().name(), ec.value(), ec.message());
}

} // namespace gmon

template <>
struct std::is_error_code_enum<gmon::ErrorCode> : std::true_type {};

template <>
struct std::is_error_condition_enum<gmon::ErrorCondition> : std::true_type {};
