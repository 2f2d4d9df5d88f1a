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

#include "gmon/error_codes.hpp"


namespace {

struct GmonErrorCategory : public std::error_category
{
    const char* name() const noexcept override
    {
        return "gmon";
    }

    std::string message(int code) const override
    {
        using gmon::ErrorCode;
        switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::Cancelled:
            return "context canceled";
        case ErrorCode::DeadlineExceeded:
            return "context deadline exceeded";
        case ErrorCode::IdleTimeout:
            return "timeout: no recent network activity";
        case ErrorCode::NilConnection:
            return "connection is nil after dialing";
        case ErrorCode::StatsNotReady:
            return "stats not ready";
        case ErrorCode::NoPacketsReceived:
            return "no packets received";
        case ErrorCode::InvalidArgument:
            return "invalid argument";
        case ErrorCode::InterfaceNotFound:
            return "interface not found";
        case ErrorCode::SocketClosed:
            return "socket closed";
        case ErrorCode::LogicError:
            return "logic error";
        case ErrorCode::FileNotFound:
            return "file not found";
        case ErrorCode::InvalidJson:
            return "invalid JSON";
        case ErrorCode::CommandFailed:
            return "command failed";
        case ErrorCode::OverlayDown:
            return "doublezero session is not up";
        case ErrorCode::SourceUserNotFound:
            return "source user not found in program data";
        case ErrorCode::NotInitialized:
            return "not initialized";
        default:
            return "unexpected error code";
        }
    }

    bool equivalent(int code, const std::error_condition& cond) const noexcept override
    {
        using gmon::ErrorCode;
        using gmon::ErrorCondition;
        if (cond.category() != gmon::gmon_error_condition()) return false;
        const auto value = static_cast<ErrorCondition>(cond.value());
        switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::Ok:
            return value == ErrorCondition::Ok;
        case ErrorCode::Cancelled:
            return value == ErrorCondition::Cancelled;
        case ErrorCode::DeadlineExceeded:
        case ErrorCode::IdleTimeout:
            return value == ErrorCondition::Timeout;
        case ErrorCode::InvalidArgument:
            return value == ErrorCondition::InvalidArgument;
        case ErrorCode::InterfaceNotFound:
        case ErrorCode::SocketClosed:
        case ErrorCode::FileNotFound:
        case ErrorCode::CommandFailed:
        case ErrorCode::OverlayDown:
            return value == ErrorCondition::Unavailable;
        default:
            return false;
        }
    }
};

struct GmonErrorCondition : public std::error_category
{
    const char* name() const noexcept override
    {
        return "gmon-condition";
    }

    std::string message(int code) const override
    {
        using gmon::ErrorCondition;
        switch (static_cast<ErrorCondition>(code)) {
        case ErrorCondition::Ok:
            return "ok";
        case ErrorCondition::Cancelled:
            return "cancelled";
        case ErrorCondition::Timeout:
            return "timeout";
        case ErrorCondition::InvalidArgument:
            return "invalid argument";
        case ErrorCondition::Unavailable:
            return "unavailable";
        default:
            return "unexpected condition";
        }
    }
};

GmonErrorCategory errorCategory;
GmonErrorCondition errorCondition;

} // namespace

const std::error_category& gmon::gmon_error_category()
{
    return errorCategory;
}

const std::error_category& gmon::gmon_error_condition()
{
    return errorCondition;
}
