#include "sql_utils.hpp"
#include "sql_scanner.hpp"
#include <algorithm>
#include <cctype>

namespace sqlscript {

std::string trimSqlString(std::string_view str) {
    const auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    const auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

std::vector<std::string> splitSqlStatements(std::string_view script) {
    std::vector<std::string> statements;

    // The scanner is back in normal mode at every delimiter, so a single pass
    // yields the same cuts as rescanning each remainder from scratch.
    SqlScanner scanner(script);
    std::size_t statement_start = 0;

    while (!scanner.atEnd()) {
        auto delimiter = scanner.findDelimiter(';');
        std::size_t statement_end = delimiter ? *delimiter : script.size();

        std::string trimmed = trimSqlString(script.substr(statement_start, statement_end - statement_start));
        if (!trimmed.empty()) {
            statements.push_back(std::move(trimmed));
        }

        statement_start = scanner.position();
    }

    return statements;
}

std::string stripSqlComments(std::string_view statement) {
    std::string stripped;
    stripped.reserve(statement.size());

    SqlScanner scanner(statement);
    bool in_comment = false;
    while (!scanner.atEnd()) {
        ScanStep step = scanner.next();
        if (step.cls != CharClass::Comment) {
            stripped.append(statement.substr(step.offset, step.length));
            in_comment = false;
            continue;
        }
        if (step.ch == '\n' && step.length == 1) {
            stripped += '\n';
        } else if (!in_comment) {
            stripped += ' ';
        }
        in_comment = true;
    }
    return trimSqlString(stripped);
}

std::string joinSqlStatements(const std::vector<std::string>& statements) {
    std::string script;
    for (const auto& statement : statements) {
        if (!script.empty()) {
            script += '\n';
        }
        script += statement;

        SqlScanner scanner(statement);
        while (!scanner.atEnd()) {
            scanner.next();
        }
        if (scanner.inComment()) {
            script += '\n';
        }
        script += ';';
    }
    return script;
}

} // namespace sqlscript
