#pragma once

#include <string>

/// @brief Model output split into visible narrative and hidden reasoning
struct ParsedResponse {
    std::string narrative;
    std::string thinking;
};

/// @brief Separate <think>...</think> blocks (case-insensitive, may span lines) from narrative
/// Narrative pieces around the blocks are trimmed and joined with newlines; likewise the
/// reasoning blocks. Without any tags the whole response (trimmed) is narrative.
ParsedResponse parse_model_response(const std::string& response);
