// SPDX-License-Identifier: Apache-2.0

#include "SqlQuoting.hpp"

#include <algorithm>

std::string SqlEscape(std::string_view text)
{
    std::string result;
    result.reserve(text.size() + static_cast<size_t>(std::ranges::count(text, '\'')));

    for (char const ch: text)
    {
        if (ch == '\'')
            result += '\'';
        result += ch;
    }

    return result;
}

std::string SqlQuote(std::string_view text)
{
    std::string result;
    result.reserve(text.size() + 2);
    result += '\'';
    result += SqlEscape(text);
    result += '\'';
    return result;
}
