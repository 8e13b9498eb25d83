#pragma once

#include <string>
#include <vector>
#include <functional>
#include "message.h"

/// @brief Sampling parameters handed to the model client
struct GenerationParams {
    std::string model;
    double temperature = 0.7;
    int max_tokens = 1024;          // Max tokens for the response
};

/// @brief Result of one model call
struct Response {
    bool success = true;            // false if the call failed or was abandoned
    std::string content;            // Raw model text (may contain <think> blocks)
    std::string error;              // Error message (empty if success)
    std::string finish_reason;      // "stop", "length", "error", "cancelled"
    int prompt_tokens = 0;          // Tokens in the request context as counted locally
};

/// @brief The LLM client: invoke(system_prompt, messages, params) -> response
/// Called without any store lock held; may block for a long time and may throw.
using ModelInvoker = std::function<Response(const std::string& system_prompt,
                                            const std::vector<Message>& messages,
                                            const GenerationParams& params)>;
