// SPDX-License-Identifier: Apache-2.0

#include "UnicodeConverter.hpp"

bool ContainsControlCharacter(std::string_view utf8InputString)
{
    return detail::ForEachCodePoint(utf8InputString, [](char32_t codePoint) { return IsControlCharacter(codePoint); });
}
