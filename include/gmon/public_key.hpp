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

#include <fmt/format.h>

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>


namespace gmon {

/// \brief 32-byte ed25519 public key identifying Solana and DoubleZero
/// accounts. Textual representation is base58.
class PublicKey
{
public:
    static constexpr std::size_t SIZE = 32;
    using Bytes = std::array<std::uint8_t, SIZE>;

    PublicKey() = default;
    explicit PublicKey(const Bytes& bytes) : key(bytes) {}

    static Maybe<PublicKey> Parse(std::string_view base58);

    const Bytes& bytes() const { return key; }
    bool isZero() const;
    std::string toString() const;

    auto operator<=>(const PublicKey&) const = default;

private:
    Bytes key = {};
};

} // namespace gmon

template <>
struct std::hash<gmon::PublicKey>
{
    std::size_t operator()(const gmon::PublicKey& pk) const noexcept
    {
        std::size_t h = 0;
        for (auto b : pk.bytes()) h = h * 31 + b;
        return h;
    }
};

template <>
struct fmt::formatter<gmon::PublicKey> : fmt::formatter<std::string_view>
{
    auto format(const gmon::PublicKey& pk, format_context& ctx) const
    {
        return fmt::formatter<std::string_view>::format(pk.toString(), ctx);
    }
};
