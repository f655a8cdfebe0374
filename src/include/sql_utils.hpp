#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlscript {

/**
 * Splits a SQL script into statements on semicolons found in normal code.
 *
 * Semicolons inside string literals ('...', "...", `...`, triple-quoted
 * forms) and inside comments (# , --, slash-star) never split. The terminating
 * semicolon is not part of the returned statement.
 *
 * Handles:
 * - Backslash-escaped quotes: 'it\'s; fine'
 * - Doubled quotes: 'it''s; fine'
 * - Triple-quoted strings: '''a ' b; c'''
 *
 * Unterminated strings or comments swallow the rest of the script into the
 * last statement. Whitespace-only statements are dropped.
 *
 * @param script The SQL script potentially containing multiple statements
 * @return Statements in source order, trimmed of whitespace
 */
std::vector<std::string> splitSqlStatements(std::string_view script);

/**
 * Joins statements back into a script, one terminated statement per line.
 */
std::string joinSqlStatements(const std::vector<std::string>& statements);

/**
 * Removes comments from a single statement, leaving string literals intact.
 * A removed comment leaves a single space behind, or the newline that closed
 * it, so adjacent tokens never merge.
 */
std::string stripSqlComments(std::string_view statement);

/**
 * Trims whitespace from both ends of a string.
 * @param str The string to trim
 * @return Trimmed string
 */
std::string trimSqlString(std::string_view str);

} // namespace sqlscript
