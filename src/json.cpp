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

#include "gmon/details/json.hpp"

#include <spdlog/spdlog.h>

#include <fstream>


namespace gmon {
namespace details {

static boost::json::parse_options parseOptions()
{
    boost::json::parse_options opt;
    opt.allow_comments = true;
    opt.allow_trailing_commas = true;
    return opt;
}

Maybe<boost::json::value> parseJson(std::string_view text)
{
    try {
        return boost::json::parse(
            boost::json::string_view(text.data(), text.size()),
            boost::json::storage_ptr(), parseOptions());
    } catch (const std::exception& e) {
        spdlog::debug("json: {}", e.what());
        return Error(ErrorCode::InvalidJson);
    }
}

Maybe<boost::json::value> loadJsonFile(const std::filesystem::path& path)
{
    try {
        std::ifstream s(path);
        if (!s.is_open()) return Error(ErrorCode::FileNotFound);
        return boost::json::parse(s, boost::json::storage_ptr(), parseOptions());
    } catch (const std::exception& e) {
        spdlog::debug("json: {}: {}", path.string(), e.what());
        return Error(ErrorCode::InvalidJson);
    }
}

} // namespace details
} // namespace gmon
