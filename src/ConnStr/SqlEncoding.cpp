// SPDX-License-Identifier: Apache-2.0

#include "SqlEncoding.hpp"
#include "UnicodeConverter.hpp"

namespace
{

constexpr char UpperHexDigit(unsigned value) noexcept
{
    return "0123456789ABCDEF"[value & 0x0F];
}

std::string Enclose(std::string_view value, char quote)
{
    std::string result;
    result.reserve(value.size() + 2);
    result += quote;
    result += value;
    result += quote;
    return result;
}

} // end namespace

std::string PercentEncode(std::string_view value)
{
    std::string result;
    result.reserve(value.size());

    for (char const c: value)
    {
        if (IsReservedUriCharacter(c))
        {
            auto const byte = static_cast<unsigned char>(c);
            result += '%';
            result += UpperHexDigit(byte >> 4);
            result += UpperHexDigit(byte);
        }
        else
            result += c;
    }

    return result;
}

bool RequiresQuoting(std::string_view value)
{
    if (value.empty())
        return false;

    return value.front() == ' ' || value.back() == ' ' || value.contains(';') || ContainsControlCharacter(value);
}

std::string QuoteConnectionStringValue(std::string_view value)
{
    if (!RequiresQuoting(value))
        return std::string { value };

    if (!value.contains('"'))
        return Enclose(value, '"');

    if (!value.contains('\''))
        return Enclose(value, '\'');

    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char const c: value)
    {
        if (c == '"')
            escaped += "\"\"";
        else
            escaped += c;
    }

    return Enclose(escaped, '"');
}
