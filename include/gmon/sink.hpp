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
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <variant>


namespace gmon {

using FieldValue = std::variant<double, std::int64_t, std::uint64_t, bool, std::string>;

/// \brief A tagged measurement.
struct Point
{
    std::string measurement;
    std::map<std::string, std::string> tags;
    std::map<std::string, FieldValue> fields;
    std::chrono::system_clock::time_point timestamp;
};

class PointSink
{
public:
    virtual ~PointSink() = default;
    virtual void write(Point point) = 0;
    virtual void flush() {}
};

/// \brief Writes points in InfluxDB line protocol. Tags with an empty value
/// are omitted. Points without fields are dropped.
class LineProtocolSink : public PointSink
{
public:
    /// \brief Write to a stream that must outlive the sink.
    explicit LineProtocolSink(std::ostream& out);

    /// \brief Append to a file. Throws std::runtime_error if the file can't be
    /// opened.
    static std::unique_ptr<LineProtocolSink> OpenFile(const std::filesystem::path& path);

    void write(Point point) override;
    void flush() override;

    /// \brief Format a point as a single line without trailing newline.
    static std::string Format(const Point& point);

private:
    LineProtocolSink(std::unique_ptr<std::ostream> owned);

    std::unique_ptr<std::ostream> owned;
    std::ostream& out;
    std::mutex mutex;
};

} // namespace gmon
