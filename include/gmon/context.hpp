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

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>


namespace gmon {

/// \brief Cancellation and deadline scope handed to every blocking probe
/// operation.
///
/// A context is cancelled when its stop token is triggered and expired once
/// its deadline has passed. Derived contexts share the parent's stop token and
/// never extend the parent's deadline.
class Context
{
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;
    explicit Context(std::stop_token token,
        std::optional<Clock::time_point> deadline = std::nullopt)
        : token(std::move(token)), deadlineAt(deadline)
    {}

    /// \brief Derive a context that expires after `timeout` or at the parent's
    /// deadline, whichever comes first.
    Context withTimeout(Clock::duration timeout) const
    {
        auto at = Clock::now() + timeout;
        if (deadlineAt && *deadlineAt < at) at = *deadlineAt;
        return Context(token, at);
    }

    bool cancelled() const { return token.stop_requested(); }

    bool expired() const
    {
        return deadlineAt && Clock::now() >= *deadlineAt;
    }

    std::optional<Clock::time_point> deadline() const { return deadlineAt; }

    /// \brief Time left until the deadline, clamped at zero. Empty if the
    /// context has no deadline.
    std::optional<Clock::duration> remaining() const
    {
        if (!deadlineAt) return std::nullopt;
        auto left = *deadlineAt - Clock::now();
        if (left < Clock::duration::zero()) return Clock::duration::zero();
        return left;
    }

    /// \brief Returns Cancelled or DeadlineExceeded if the context is done,
    /// otherwise an empty error code.
    std::error_code err() const
    {
        if (cancelled()) return ErrorCode::Cancelled;
        if (expired()) return ErrorCode::DeadlineExceeded;
        return ErrorCode::Ok;
    }

    const std::stop_token& stopToken() const { return token; }

    /// \brief Sleep for `duration` or until the context is done.
    /// \return Error code as returned by err() after waking up.
    std::error_code sleepFor(Clock::duration duration) const
    {
        auto until = Clock::now() + duration;
        if (deadlineAt && *deadlineAt < until) until = *deadlineAt;
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        cv.wait_until(lock, token, until, [] { return false; });
        return err();
    }

private:
    std::stop_token token;
    std::optional<Clock::time_point> deadlineAt;
};

} // namespace gmon
