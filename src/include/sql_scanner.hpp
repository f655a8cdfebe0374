#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>

namespace sqlscript {

// Scanner modes. Exactly one is active at any position.
struct NormalMode {};

struct StringMode {
    char quote;
    bool triple;
};

struct CommentMode {
    char marker;  // '#', '-' or '/'
};

using ScanMode = std::variant<NormalMode, StringMode, CommentMode>;

enum class CharClass {
    Code,     // significant SQL text
    Literal,  // inside a string literal, delimiters included
    Comment   // inside a comment, markers included
};

struct ScanStep {
    std::size_t offset;
    std::size_t length;  // > 1 when a quote triple or a comment marker is consumed at once
    char ch;
    CharClass cls;
};

/**
 * Single pass, left to right cursor over a SQL text buffer.
 *
 * Tracks whether the cursor is in normal code, inside a string literal
 * ('...', "...", `...` and their triple-quoted forms) or inside a comment
 * (# , -- and slash-star). The scanner never owns the buffer; the caller
 * keeps it alive for the lifetime of the scanner.
 *
 * Unterminated strings and comments are not errors: the scanner simply
 * reaches the end of input in that mode.
 */
class SqlScanner {
public:
    explicit SqlScanner(std::string_view text, std::size_t start = 0);

    bool atEnd() const { return pos_ >= text_.size(); }
    std::size_t position() const { return pos_; }
    const ScanMode& mode() const { return mode_; }

    bool inNormal() const { return std::holds_alternative<NormalMode>(mode_); }
    bool inString() const { return std::holds_alternative<StringMode>(mode_); }
    bool inComment() const { return std::holds_alternative<CommentMode>(mode_); }

    /**
     * Advances over the next character, or over a whole multi-character marker
     * when a mode transition consumes one, and reports how it was classified.
     * Must not be called at end of input.
     */
    ScanStep next();

    /**
     * Advances until a delimiter is found in normal code and returns its
     * offset. The cursor is left just past the delimiter. Returns nullopt
     * when the input ends first.
     */
    std::optional<std::size_t> findDelimiter(char delimiter = ';');

private:
    char at(std::size_t index) const { return index < text_.size() ? text_[index] : '\0'; }
    bool escaped(std::size_t index) const { return index > 0 && text_[index - 1] == '\\'; }

    ScanStep scanNormal(char ch);
    ScanStep scanString(const StringMode& string_mode, char ch);
    ScanStep scanComment(const CommentMode& comment_mode, char ch);
    ScanStep consume(std::size_t length, CharClass cls);

    std::string_view text_;
    std::size_t pos_;
    ScanMode mode_;
};

bool isQuoteChar(char ch);

} // namespace sqlscript
