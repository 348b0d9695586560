// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <string>
#include <string_view>

/// @defgroup Quoting String literal quoting
///
/// The query builder never escapes caller supplied fragments on its own.
/// Use these functions to embed literal string values into raw SQL fragments.

/// Escapes the given text for use inside a single-quoted SQL string literal,
/// by doubling every single quote character.
///
/// @code
/// SqlEscape("O'Brien") == "O''Brien"
/// @endcode
///
/// @ingroup Quoting
[[nodiscard]] SQLITE3BUILDER_API std::string SqlEscape(std::string_view text);

/// Escapes the given text and wraps it into single quotes, yielding an SQL string literal.
///
/// @code
/// SqlQuote("O'Brien") == "'O''Brien'"
/// @endcode
///
/// @ingroup Quoting
[[nodiscard]] SQLITE3BUILDER_API std::string SqlQuote(std::string_view text);
