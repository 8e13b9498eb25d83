#include "inkwell.h"
#include "history_simulator.h"
#include <algorithm>

HistorySimulator::HistorySimulator(std::string simulated_prompt)
    : simulated_prompt_(std::move(simulated_prompt)) {
}

std::vector<Message> HistorySimulator::simulate(const std::vector<std::string>& chunks, size_t max_chunks) const {
    size_t count = std::min(max_chunks, chunks.size());
    size_t start = chunks.size() - count;

    std::vector<Message> messages;
    messages.reserve(count * 2);
    for (size_t i = start; i < chunks.size(); i++) {
        messages.emplace_back(Message::USER, simulated_prompt_);
        messages.emplace_back(Message::ASSISTANT, chunks[i]);
        dprintf(2, "simulated pair %zu: '%s'", i - start + 1, inkwell::preview(chunks[i], 50).c_str());
    }

    LOG_DEBUG_FMT("Simulated {} conversation pairs from {} chunks", count, chunks.size());
    return messages;
}

std::unique_ptr<HistoryStore> HistorySimulator::build(const std::vector<std::string>& chunks, size_t max_chunks,
                                                      int max_tokens, std::shared_ptr<Tokenizer> tokenizer) const {
    auto store = std::make_unique<HistoryStore>(std::move(tokenizer), max_tokens);
    seed(*store, chunks, max_chunks);
    return store;
}

void HistorySimulator::seed(HistoryStore& store, const std::vector<std::string>& chunks, size_t max_chunks) const {
    store.reset(simulate(chunks, max_chunks));
    LOG_INFO_FMT("Seeded conversation memory with {} messages ({}/{} tokens)",
                 store.get_message_count(), store.get_token_count(), store.get_max_tokens());
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_canon_text(const std::string& raw) {
    // Normalize CRLF so Windows-edited stories split on blank lines too
    std::string text;
    text.reserve(raw.length());
    for (size_t i = 0; i < raw.length(); i++) {
        if (raw[i] == '\r' && i + 1 < raw.length() && raw[i + 1] == '\n') {
            continue;
        }
        text += raw[i];
    }

    std::vector<std::string> chunks;
    size_t pos = 0;
    while (pos <= text.length()) {
        size_t next = text.find("\n\n", pos);
        std::string piece = trim(text.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (!piece.empty()) {
            chunks.push_back(piece);
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 2;
    }
    return chunks;
}

std::string join_canon_text(const std::vector<std::string>& chunks) {
    std::string text;
    for (size_t i = 0; i < chunks.size(); i++) {
        if (i > 0) {
            text += "\n\n";
        }
        text += chunks[i];
    }
    return text;
}
