// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <optional>
#include <string_view>

namespace detail
{

// Incremental UTF-8 decoder, fed one code unit at a time.
//
// Ill-formed input yields U+FFFD (REPLACEMENT CHARACTER), including overlong forms,
// surrogates and code points beyond U+10FFFF.
// A code unit that Interrupts() a pending sequence must be fed again after Reset().
struct Utf8Decoder
{
    char32_t codePoint = 0;
    char32_t minimumCodePoint = 0;
    int pendingCodeUnits = 0;

    static constexpr auto InvalidCodePoint = char32_t { 0xFFFD };

    [[nodiscard]] constexpr bool Interrupts(char c) const noexcept
    {
        return pendingCodeUnits != 0 && (static_cast<unsigned char>(c) & 0b1100'0000) != 0b1000'0000;
    }

    constexpr void Reset() noexcept
    {
        codePoint = 0;
        minimumCodePoint = 0;
        pendingCodeUnits = 0;
    }

    constexpr std::optional<char32_t> Process(char c) noexcept
    {
        auto const c8 = static_cast<unsigned char>(c);

        if ((c8 & 0b1100'0000) == 0b1000'0000)
        {
            if (pendingCodeUnits == 0)
                return InvalidCodePoint;
            codePoint = (codePoint << 6) | (c8 & 0b0011'1111);
            if (--pendingCodeUnits != 0)
                return std::nullopt;

            auto const result = codePoint;
            auto const minimum = minimumCodePoint;
            Reset();
            if (result < minimum || result > 0x10FFFF || (result >= 0xD800 && result <= 0xDFFF))
                return InvalidCodePoint;
            return result;
        }

        if ((c8 & 0b1000'0000) == 0)
            return char32_t { c8 };

        if ((c8 & 0b1110'0000) == 0b1100'0000)
        {
            codePoint = c8 & 0b0001'1111;
            minimumCodePoint = 0x80;
            pendingCodeUnits = 1;
            return std::nullopt;
        }

        if ((c8 & 0b1111'0000) == 0b1110'0000)
        {
            codePoint = c8 & 0b0000'1111;
            minimumCodePoint = 0x800;
            pendingCodeUnits = 2;
            return std::nullopt;
        }

        if ((c8 & 0b1111'1000) == 0b1111'0000)
        {
            codePoint = c8 & 0b0000'0111;
            minimumCodePoint = 0x10000;
            pendingCodeUnits = 3;
            return std::nullopt;
        }

        return InvalidCodePoint;
    }
};

// Calls the given callable for each code point decoded from a UTF-8 string.
//
// The callable returns true to stop the iteration early.
// Returns true if the iteration was stopped by the callable.
template <typename Callable>
constexpr bool ForEachCodePoint(std::string_view utf8, Callable&& callable)
{
    auto decoder = Utf8Decoder {};
    for (char const c: utf8)
    {
        if (decoder.Interrupts(c))
        {
            decoder.Reset();
            if (callable(Utf8Decoder::InvalidCodePoint))
                return true;
        }

        if (auto const codePoint = decoder.Process(c); codePoint.has_value())
        {
            if (callable(*codePoint))
                return true;
        }
    }

    // Truncated trailing sequence.
    if (decoder.pendingCodeUnits != 0)
        return callable(Utf8Decoder::InvalidCodePoint);

    return false;
}

} // namespace detail

/// Tests if the given code point is a Unicode control character (general category Cc).
///
/// That is U+0000 to U+001F (C0 controls) and U+007F to U+009F (DELETE and C1 controls).
constexpr bool IsControlCharacter(char32_t codePoint) noexcept
{
    return codePoint <= 0x1F || (codePoint >= 0x7F && codePoint <= 0x9F);
}

/// Tests if the given UTF-8 encoded string contains at least one Unicode control character.
CONNSTR_API bool ContainsControlCharacter(std::string_view utf8InputString);

