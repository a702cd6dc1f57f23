// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <string>
#include <string_view>

/// Replaces each reserved URI character with its percent-encoded form.
///
/// The reserved characters are `! # $ & ' ( ) * + , / : ; = ? @ [ ]`, each replaced by `%` followed
/// by its two-digit uppercase hexadecimal value (e.g. `@` becomes `%40`).
/// Any other byte is copied unchanged, including `%` itself, control characters and non-ASCII.
///
/// @see https://en.wikipedia.org/wiki/Percent-encoding#Reserved_characters
[[nodiscard]] CONNSTR_API std::string PercentEncode(std::string_view value);

/// Tests if the given character is one of the reserved URI characters handled by PercentEncode().
[[nodiscard]] constexpr bool IsReservedUriCharacter(char c) noexcept
{
    switch (c)
    {
        case '!':
        case '#':
        case '$':
        case '&':
        case '\'':
        case '(':
        case ')':
        case '*':
        case '+':
        case ',':
        case '/':
        case ':':
        case ';':
        case '=':
        case '?':
        case '@':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

/// Tests if a value must be enclosed in quotation marks inside a SQL Server connection string.
///
/// This is the case if the value contains a semicolon or a Unicode control character,
/// or if it starts or ends with a space.
[[nodiscard]] CONNSTR_API bool RequiresQuoting(std::string_view value);

/// Encloses a SQL Server connection string value in quotation marks, if required.
///
/// Values that do not satisfy RequiresQuoting() are returned unchanged.
/// Otherwise double quotation marks are preferred:
///   - a value without `"` is enclosed in `"`,
///   - a value containing `"` but no `'` is enclosed in `'`,
///   - a value containing both gets every `"` doubled and is then enclosed in `"`.
///
/// @see https://learn.microsoft.com/en-us/sql/connect/ado-net/connection-strings
[[nodiscard]] CONNSTR_API std::string QuoteConnectionStringValue(std::string_view value);
