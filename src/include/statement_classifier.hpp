#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlscript {

// Decides how a statement is executed:
//   Query        -> single-use read-only transaction
//   DataChange   -> its own read/write transaction
//   SchemaChange -> schema update
enum class StatementKind {
    Unspecified,
    Query,
    DataChange,
    SchemaChange
};

const char* statementKindName(StatementKind kind);

// Leading keywords recognised for a kind, upper case. Empty for Unspecified.
const std::vector<std::string>& keywordsFor(StatementKind kind);

/**
 * Returns the first run of non-whitespace characters that lies outside any
 * comment. A comment ends a run the same way whitespace does. Returns an
 * empty string for empty or comment-only statements.
 */
std::string firstKeyword(std::string_view statement);

/**
 * Classifies a statement by its first keyword outside comments.
 * Matching is case-insensitive and only considers the leading identifier
 * characters of the keyword, so "select*" is a query. Never throws.
 */
StatementKind classifyStatement(std::string_view statement);

} // namespace sqlscript
