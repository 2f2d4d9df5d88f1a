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

#include "gmon/public_key.hpp"

#include <algorithm>
#include <vector>


namespace gmon {

static constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

Maybe<PublicKey> PublicKey::Parse(std::string_view str)
{
    if (str.empty()) return Error(ErrorCode::InvalidArgument);

    // Big number in base 256, most significant byte first.
    std::vector<std::uint8_t> num;
    num.reserve(SIZE);
    for (char c : str) {
        auto digit = BASE58_ALPHABET.find(c);
        if (digit == std::string_view::npos) return Error(ErrorCode::InvalidArgument);
        std::uint32_t carry = (std::uint32_t)digit;
        for (auto i = num.rbegin(); i != num.rend(); ++i) {
            carry += 58u * (*i);
            *i = (std::uint8_t)(carry & 0xff);
            carry >>= 8;
        }
        while (carry) {
            num.insert(num.begin(), (std::uint8_t)(carry & 0xff));
            carry >>= 8;
        }
    }
    // Leading '1's encode leading zero bytes.
    auto zeros = std::distance(str.begin(),
        std::find_if(str.begin(), str.end(), [] (char c) { return c != '1'; }));
    if ((std::size_t)zeros + num.size() != SIZE) return Error(ErrorCode::InvalidArgument);

    Bytes bytes = {};
    std::copy(num.begin(), num.end(), bytes.begin() + zeros);
    return PublicKey(bytes);
}

bool PublicKey::isZero() const
{
    return std::all_of(key.begin(), key.end(), [] (std::uint8_t b) { return b == 0; });
}

std::string PublicKey::toString() const
{
    auto first = std::find_if(key.begin(), key.end(), [] (std::uint8_t b) { return b != 0; });
    std::size_t zeros = (std::size_t)std::distance(key.begin(), first);

    // Digits in base 58, least significant first.
    std::vector<std::uint8_t> digits;
    digits.reserve(SIZE * 138 / 100 + 1);
    for (auto i = first; i != key.end(); ++i) {
        std::uint32_t carry = *i;
        for (auto& d : digits) {
            carry += (std::uint32_t)d << 8;
            d = (std::uint8_t)(carry % 58);
            carry /= 58;
        }
        while (carry) {
            digits.push_back((std::uint8_t)(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    for (auto d = digits.rbegin(); d != digits.rend(); ++d) {
        out.push_back(BASE58_ALPHABET[*d]);
    }
    return out;
}

} // namespace gmon
