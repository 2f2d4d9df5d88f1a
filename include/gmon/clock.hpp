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

#include <chrono>
#include <mutex>


namespace gmon {

/// \brief Source of wall-clock timestamps for probe results.
class Clock
{
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock
{
public:
    time_point now() const override
    {
        return std::chrono::system_clock::now();
    }
};

/// \brief Manually advanced clock.
class FakeClock : public Clock
{
public:
    explicit FakeClock(time_point start = time_point{})
        : current(start)
    {}

    time_point now() const override
    {
        std::lock_guard lock(mutex);
        return current;
    }

    void set(time_point t)
    {
        std::lock_guard lock(mutex);
        current = t;
    }

    void advance(std::chrono::system_clock::duration d)
    {
        std::lock_guard lock(mutex);
        current += d;
    }

private:
    mutable std::mutex mutex;
    time_point current;
};

} // namespace gmon
