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

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>


namespace gmon {

static void escape(std::string& out, std::string_view str, std::string_view special)
{
    for (char c : str) {
        if (special.find(c) != special.npos) out.push_back('\\');
        out.push_back(c);
    }
}

static void appendField(std::string& out, const FieldValue& value)
{
    std::visit([&out] (auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double>) {
            out += fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            out += fmt::format("{}i", v);
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            out += fmt::format("{}u", v);
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else {
            out.push_back('"');
            escape(out, v, "\"\\");
            out.push_back('"');
        }
    }, value);
}

LineProtocolSink::LineProtocolSink(std::ostream& out)
    : out(out)
{}

LineProtocolSink::LineProtocolSink(std::unique_ptr<std::ostream> owned)
    : owned(std::move(owned)), out(*this->owned)
{}

std::unique_ptr<LineProtocolSink> LineProtocolSink::OpenFile(const std::filesystem::path& path)
{
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open())
        throw std::runtime_error(fmt::format("can't open {} for writing", path.string()));
    return std::unique_ptr<LineProtocolSink>(new LineProtocolSink(std::move(file)));
}

std::string LineProtocolSink::Format(const Point& point)
{
    std::string line;
    escape(line, point.measurement, ", ");
    for (auto&& [key, value] : point.tags) {
        if (value.empty()) continue;
        line.push_back(',');
        escape(line, key, ",= ");
        line.push_back('=');
        escape(line, value, ",= ");
    }
    bool first = true;
    for (auto&& [key, value] : point.fields) {
        line.push_back(first ? ' ' : ',');
        first = false;
        escape(line, key, ",= ");
        line.push_back('=');
        appendField(line, value);
    }
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        point.timestamp.time_since_epoch()).count();
    line += fmt::format(" {}", ns);
    return line;
}

void LineProtocolSink::write(Point point)
{
    if (point.fields.empty()) {
        spdlog::debug("sink: dropping point without fields ({})", point.measurement);
        return;
    }
    auto line = Format(point);
    std::lock_guard lock(mutex);
    out << line << '\n';
}

void LineProtocolSink::flush()
{
    std::lock_guard lock(mutex);
    out.flush();
}

} // namespace gmon
