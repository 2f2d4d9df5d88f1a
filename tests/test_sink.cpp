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

#include "gmon/sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace std::chrono_literals;


TEST(LineProtocolSink, Format)
{
    using namespace gmon;
    Point point;
    point.measurement = "solana_validator_icmp_probe";
    point.tags = {
        {"probe_type", "icmp"},
        {"source_host", "probe ams,1"},
        {"target_geoip_city", ""},
    };
    point.fields = {
        {"probe_ok", true},
        {"probe_loss_ratio", 0.25},
        {"probe_packets_sent", std::int64_t(4)},
        {"probe_fail_reason", std::string("say \"hi\"")},
        {"count", std::uint64_t(7)},
    };
    point.timestamp = std::chrono::system_clock::time_point(1700000000s + 5ns);

    EXPECT_EQ(LineProtocolSink::Format(point),
        "solana_validator_icmp_probe,probe_type=icmp,source_host=probe\\ ams\\,1"
        " count=7u,probe_fail_reason=\"say \\\"hi\\\"\",probe_loss_ratio=0.25,"
        "probe_ok=true,probe_packets_sent=4i 1700000000000000005");
}

TEST(LineProtocolSink, Write)
{
    using namespace gmon;
    std::stringstream out;
    LineProtocolSink sink(out);

    Point empty;
    empty.measurement = "m";
    sink.write(empty);
    EXPECT_TRUE(out.str().empty());

    Point point;
    point.measurement = "m";
    point.fields["ok"] = false;
    sink.write(point);
    sink.write(point);
    sink.flush();
    EXPECT_EQ(out.str(), "m ok=false 0\nm ok=false 0\n");
}

TEST(LineProtocolSink, OpenFileFails)
{
    EXPECT_THROW(gmon::LineProtocolSink::OpenFile("/nonexistent/dir/out.lp"), std::runtime_error);
}
