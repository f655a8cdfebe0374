#pragma once

#include <map>
#include <string>
#include <vector>
#include <crow/json.h>

namespace sqlscript {

struct StaticCompletion {
    std::string label;
    std::string detail;
    std::string filter_text;
    std::string sort_text;
    std::string documentation;  // markdown

    crow::json::wvalue toJson() const;
};

/**
 * Keyword and function completions offered to editors. The table is
 * computed on first access, shared by every caller and never rebuilt.
 */
class CompletionCatalog {
public:
    static const std::map<std::string, StaticCompletion>& staticCompletions();

    static const std::vector<std::string>& keywords();
    static const std::vector<std::string>& numericFunctions();
    static const std::vector<std::string>& stringFunctions();
    static const std::vector<std::string>& dateFunctions();

    static crow::json::wvalue toJson();

    // Number of times the table has been built; stays at 1.
    static int buildCount();

private:
    static std::map<std::string, StaticCompletion> build();
};

} // namespace sqlscript
