#include "sql_scanner.hpp"

#include <algorithm>

namespace sqlscript {

bool isQuoteChar(char ch) {
    return ch == '\'' || ch == '"' || ch == '`';
}

SqlScanner::SqlScanner(std::string_view text, std::size_t start)
    : text_(text), pos_(std::min(start, text.size())), mode_(NormalMode{}) {}

ScanStep SqlScanner::next() {
    const char ch = text_[pos_];
    if (auto* string_mode = std::get_if<StringMode>(&mode_)) {
        return scanString(*string_mode, ch);
    }
    if (auto* comment_mode = std::get_if<CommentMode>(&mode_)) {
        return scanComment(*comment_mode, ch);
    }
    return scanNormal(ch);
}

std::optional<std::size_t> SqlScanner::findDelimiter(char delimiter) {
    while (!atEnd()) {
        ScanStep step = next();
        if (step.cls == CharClass::Code && step.ch == delimiter) {
            return step.offset;
        }
    }
    return std::nullopt;
}

ScanStep SqlScanner::scanNormal(char ch) {
    const char next_ch = at(pos_ + 1);

    if (isQuoteChar(ch) && !escaped(pos_)) {
        bool triple = next_ch == ch && at(pos_ + 2) == ch;
        mode_ = StringMode{ch, triple};
        return consume(triple ? 3 : 1, CharClass::Literal);
    }

    if ((ch == '#' && next_ch == ' ') || (ch == '-' && next_ch == '-') || (ch == '/' && next_ch == '*')) {
        mode_ = CommentMode{ch};
        return consume(2, CharClass::Comment);
    }

    return consume(1, CharClass::Code);
}

ScanStep SqlScanner::scanString(const StringMode& string_mode, char ch) {
    if (ch != string_mode.quote || escaped(pos_)) {
        return consume(1, CharClass::Literal);
    }

    if (!string_mode.triple) {
        mode_ = NormalMode{};
        return consume(1, CharClass::Literal);
    }

    // A lone quote inside a triple-quoted string is content.
    if (at(pos_ + 1) == ch && at(pos_ + 2) == ch) {
        mode_ = NormalMode{};
        return consume(3, CharClass::Literal);
    }
    return consume(1, CharClass::Literal);
}

ScanStep SqlScanner::scanComment(const CommentMode& comment_mode, char ch) {
    if (comment_mode.marker == '/') {
        if (ch == '*' && at(pos_ + 1) == '/') {
            mode_ = NormalMode{};
            return consume(2, CharClass::Comment);
        }
    } else if (ch == '\n') {
        mode_ = NormalMode{};
    }
    return consume(1, CharClass::Comment);
}

ScanStep SqlScanner::consume(std::size_t length, CharClass cls) {
    length = std::min(length, text_.size() - pos_);
    ScanStep step{pos_, length, text_[pos_], cls};
    pos_ += length;
    return step;
}

} // namespace sqlscript
