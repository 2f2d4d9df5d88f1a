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

#include "gmon/context.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace std::chrono_literals;


TEST(Context, DefaultNeverDone)
{
    gmon::Context ctx;
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_FALSE(ctx.expired());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.remaining().has_value());
    EXPECT_FALSE(ctx.err());
}

TEST(Context, Cancel)
{
    using namespace gmon;
    std::stop_source stop;
    Context ctx(stop.get_token());
    auto child = ctx.withTimeout(1h);
    stop.request_stop();
    EXPECT_TRUE(ctx.cancelled());
    EXPECT_TRUE(child.cancelled());
    EXPECT_EQ(child.err(), ErrorCode::Cancelled);
    EXPECT_EQ(child.err(), ErrorCondition::Cancelled);
}

TEST(Context, ChildNeverExtendsDeadline)
{
    using namespace gmon;
    auto parent = Context().withTimeout(10ms);
    auto child = parent.withTimeout(1h);
    EXPECT_EQ(child.deadline(), parent.deadline());
    auto shorter = parent.withTimeout(1ms);
    EXPECT_LT(*shorter.deadline(), *parent.deadline());
}

TEST(Context, SleepStopsAtDeadline)
{
    using namespace gmon;
    auto ctx = Context().withTimeout(20ms);
    auto start = Context::Clock::now();
    auto ec = ctx.sleepFor(10s);
    EXPECT_LT(Context::Clock::now() - start, 5s);
    EXPECT_EQ(ec, ErrorCode::DeadlineExceeded);
    EXPECT_EQ(ec, ErrorCondition::Timeout);
    EXPECT_EQ(ctx.remaining(), Context::Clock::duration::zero());
}

TEST(Context, SleepWakesOnCancel)
{
    using namespace gmon;
    std::stop_source stop;
    Context ctx(stop.get_token());
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(10ms);
        stop.request_stop();
    });
    auto ec = ctx.sleepFor(10s);
    EXPECT_EQ(ec, ErrorCode::Cancelled);
}
