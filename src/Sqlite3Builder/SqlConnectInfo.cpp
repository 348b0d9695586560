// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <ranges>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
    // Disable warning C4996: This function or variable may be unsafe.
    // It is complaining about getenv, which is fine to use in this case.
    #pragma warning(disable : 4996)
#endif

namespace
{

constexpr std::string_view DropQuotation(std::string_view value) noexcept
{
    if (!value.empty() && value.front() == '{' && value.back() == '}')
    {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

constexpr std::string_view Trim(std::string_view value) noexcept
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);

    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);

    return value;
}

std::string ToUpperCaseString(std::string_view input)
{
    std::string result { input };
    std::ranges::transform(result, result.begin(), [](char c) { return (char) std::toupper(c); });
    return result;
}

} // end namespace

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    std::regex const pwdRegex {
        R"(PWD=.*?(;|$))",
        std::regex_constants::ECMAScript | std::regex_constants::icase,
    };
    std::stringstream outputString;
    std::regex_replace(
        std::ostreambuf_iterator<char> { outputString }, input.begin(), input.end(), pwdRegex, "Pwd=***$1");
    return outputString.str();
}

SqlConnectionString SqlConnectionString::Sqlite3(std::string_view databasePath)
{
    return SqlConnectionString { .value = std::format("DRIVER=SQLite3;Database={}", databasePath) };
}

std::optional<SqlConnectionString> SqlConnectionString::FromEnvironment(char const* variableName)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (auto const* value = std::getenv(variableName); value && *value)
        return SqlConnectionString { .value = value };
    return std::nullopt;
}

SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString)
{
    auto pairs = connectionString.value | std::views::split(';') | std::views::transform([](auto pair_view) {
                     return std::string_view(pair_view.begin(), pair_view.end());
                 });

    SqlConnectionStringMap result;

    for (auto const& pair: pairs)
    {
        auto separatorPosition = pair.find('=');
        if (separatorPosition != std::string_view::npos)
        {
            auto const key = Trim(pair.substr(0, separatorPosition));
            auto const value = DropQuotation(Trim(pair.substr(separatorPosition + 1)));
            result.insert_or_assign(ToUpperCaseString(key), std::string(value));
        }
    }

    return result;
}

SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map)
{
    SqlConnectionString result;

    for (auto const& [key, value]: map)
    {
        std::string_view const delimiter = result.value.empty() ? "" : ";";
        result.value += std::format("{}{}={{{}}}", delimiter, key, value);
    }

    return result;
}
