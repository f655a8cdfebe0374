#include "completion_catalog.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

namespace sqlscript {

namespace {

std::once_flag completions_once;
std::map<std::string, StaticCompletion> completions_cache;
std::atomic<int> completions_builds{0};

} // namespace

crow::json::wvalue StaticCompletion::toJson() const {
    crow::json::wvalue json;
    json["label"] = label;
    json["detail"] = detail;
    json["filterText"] = filter_text;
    json["sortText"] = sort_text;
    json["documentation"]["kind"] = "markdown";
    json["documentation"]["value"] = documentation;
    return json;
}

const std::vector<std::string>& CompletionCatalog::keywords() {
    static const std::vector<std::string> list = {
        "SELECT", "WITH", "INSERT", "UPDATE", "DELETE", "CREATE", "ALTER", "DROP"
    };
    return list;
}

const std::vector<std::string>& CompletionCatalog::numericFunctions() {
    static const std::vector<std::string> list = {
        "ABS", "SIGN", "ISINF", "ISNAN", "SQRT", "CBRT", "POW", "POWER", "EXP", "LN", "LOG", "LOG2", "LOG10",
        "GREATEST", "LEAST", "MOD", "ROUND", "TRUNC", "CEIL", "CEILING", "FLOOR", "COS", "ACOS", "SIN", "ASIN",
        "TAN", "ATAN", "ATAN2", "RADIANS", "DEGREES", "PI", "RANDOM", "HASH", "MD5", "SHA256"
    };
    return list;
}

const std::vector<std::string>& CompletionCatalog::stringFunctions() {
    static const std::vector<std::string> list = {
        "LENGTH", "STRLEN", "CONCAT", "CONCAT_WS", "CONTAINS", "STARTS_WITH", "ENDS_WITH", "FORMAT", "FROM_BASE64",
        "TO_BASE64", "HEX", "UNHEX", "LPAD", "RPAD", "LOWER", "UPPER", "LTRIM", "RTRIM", "TRIM",
        "REGEXP_MATCHES", "REGEXP_EXTRACT", "REGEXP_EXTRACT_ALL", "REGEXP_REPLACE", "REPLACE", "REPEAT",
        "REVERSE", "SPLIT_PART", "STRING_SPLIT", "STRPOS", "SUBSTRING", "SUBSTR", "JSON_EXTRACT", "JSON_VALUE"
    };
    return list;
}

const std::vector<std::string>& CompletionCatalog::dateFunctions() {
    static const std::vector<std::string> list = {
        "CURRENT_DATE", "CURRENT_TIMESTAMP", "NOW", "EXTRACT", "DATE_ADD", "DATE_SUB", "DATE_DIFF", "DATE_TRUNC",
        "DATE_PART", "STRFTIME", "STRPTIME", "MAKE_DATE", "MAKE_TIMESTAMP", "EPOCH", "EPOCH_MS", "EPOCH_US",
        "TO_TIMESTAMP", "LAST_DAY", "DAYNAME", "MONTHNAME", "AGE"
    };
    return list;
}

std::map<std::string, StaticCompletion> CompletionCatalog::build() {
    std::map<std::string, StaticCompletion> completions;
    const auto& keyword_list = keywords();

    auto add = [&](const std::string& name) {
        bool is_keyword = std::find(keyword_list.begin(), keyword_list.end(), name) != keyword_list.end();
        completions[name] = StaticCompletion{name, name, name, (is_keyword ? "2:" : "") + name, name};
    };

    for (const auto* list : {&keyword_list, &numericFunctions(), &stringFunctions(), &dateFunctions()}) {
        std::for_each(list->begin(), list->end(), add);
    }
    return completions;
}

const std::map<std::string, StaticCompletion>& CompletionCatalog::staticCompletions() {
    std::call_once(completions_once, [] {
        completions_cache = build();
        ++completions_builds;
    });
    return completions_cache;
}

crow::json::wvalue CompletionCatalog::toJson() {
    crow::json::wvalue json;
    for (const auto& [name, completion] : staticCompletions()) {
        json[name] = completion.toJson();
    }
    return json;
}

int CompletionCatalog::buildCount() {
    return completions_builds.load();
}

} // namespace sqlscript
