// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <regex>
#include <string>
#include <string_view>

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    static std::regex const uriSchemeRegex {
        R"(^[A-Za-z][A-Za-z0-9+.\-]*://)",
        std::regex_constants::ECMAScript,
    };

    // scheme://username:password@
    static std::regex const uriPwdRegex {
        R"(^([A-Za-z][A-Za-z0-9+.\-]*://[^:@/]*:)[^@/?]*@)",
        std::regex_constants::ECMAScript,
    };

    // ?password=<value> or &pwd=<value>
    static std::regex const uriQueryPwdRegex {
        R"(([?&](?:password|pwd)=)[^&]*)",
        std::regex_constants::ECMAScript | std::regex_constants::icase,
    };

    // password=<value> or pwd=<value>, where the value may be enclosed in single or double quotes.
    static std::regex const keyValuePwdRegex {
        R"((^|;)(\s*(?:password|pwd)\s*=)("(?:[^"]|"")*"|'[^']*'|[^;]*))",
        std::regex_constants::ECMAScript | std::regex_constants::icase,
    };

    auto const inputString = std::string { input };

    if (std::regex_search(inputString, uriSchemeRegex))
    {
        auto const sanitizedUserInfo = std::regex_replace(inputString, uriPwdRegex, "$1***@");
        return std::regex_replace(sanitizedUserInfo, uriQueryPwdRegex, "$1***");
    }

    return std::regex_replace(inputString, keyValuePwdRegex, "$1$2***");
}
