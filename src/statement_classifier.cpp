#include "statement_classifier.hpp"
#include "sql_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sqlscript {

namespace {

const std::array<std::pair<StatementKind, std::vector<std::string>>, 3>& keywordSets() {
    static const std::array<std::pair<StatementKind, std::vector<std::string>>, 3> sets = {{
        {StatementKind::Query, {"SELECT", "WITH"}},
        {StatementKind::DataChange, {"INSERT", "UPDATE", "DELETE"}},
        {StatementKind::SchemaChange, {"CREATE", "ALTER", "DROP"}},
    }};
    return sets;
}

std::string leadingWordUpper(const std::string& keyword) {
    std::string word;
    for (unsigned char ch : keyword) {
        if (!std::isalnum(ch) && ch != '_') {
            break;
        }
        word += static_cast<char>(std::toupper(ch));
    }
    return word;
}

} // namespace

const char* statementKindName(StatementKind kind) {
    switch (kind) {
        case StatementKind::Query:
            return "QUERY";
        case StatementKind::DataChange:
            return "DML";
        case StatementKind::SchemaChange:
            return "DDL";
        case StatementKind::Unspecified:
        default:
            return "UNSPECIFIED";
    }
}

const std::vector<std::string>& keywordsFor(StatementKind kind) {
    static const std::vector<std::string> none;
    for (const auto& [set_kind, keywords] : keywordSets()) {
        if (set_kind == kind) {
            return keywords;
        }
    }
    return none;
}

std::string firstKeyword(std::string_view statement) {
    SqlScanner scanner(statement);
    std::string keyword;

    while (!scanner.atEnd()) {
        ScanStep step = scanner.next();
        bool separator = step.cls == CharClass::Comment || std::isspace(static_cast<unsigned char>(step.ch));
        if (separator) {
            if (!keyword.empty()) {
                break;
            }
            continue;
        }
        keyword.append(statement.substr(step.offset, step.length));
    }
    return keyword;
}

StatementKind classifyStatement(std::string_view statement) {
    std::string word = leadingWordUpper(firstKeyword(statement));
    if (word.empty()) {
        return StatementKind::Unspecified;
    }

    for (const auto& [kind, keywords] : keywordSets()) {
        if (std::find(keywords.begin(), keywords.end(), word) != keywords.end()) {
            return kind;
        }
    }
    return StatementKind::Unspecified;
}

} // namespace sqlscript
