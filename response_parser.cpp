#include "response_parser.h"
#include <regex>
#include <vector>

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string join_non_empty(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!out.empty()) out += "\n";
        out += part;
    }
    return out;
}

ParsedResponse parse_model_response(const std::string& response) {
    // [\s\S] instead of '.' so blocks may span lines
    static const std::regex think_pattern("<think>([\\s\\S]*?)</think>", std::regex::icase);

    std::vector<std::string> narrative_parts;
    std::vector<std::string> thinking_parts;
    size_t last_end = 0;

    for (auto it = std::sregex_iterator(response.begin(), response.end(), think_pattern);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        narrative_parts.push_back(trim(response.substr(last_end, start - last_end)));
        thinking_parts.push_back(trim(match[1].str()));
        last_end = start + static_cast<size_t>(match.length(0));
    }
    narrative_parts.push_back(trim(response.substr(last_end)));

    ParsedResponse parsed;
    parsed.narrative = join_non_empty(narrative_parts);
    parsed.thinking = join_non_empty(thinking_parts);
    return parsed;
}
