#include "inkwell.h"
#include "story_session.h"
#include "response_parser.h"
#include "truncation_policy.h"

#include <fstream>
#include <sstream>

StorySession::StorySession(const Config& config, std::shared_ptr<Tokenizer> tokenizer)
    : memory_(std::make_unique<HistoryStore>(std::move(tokenizer), config.max_tokens))
    , simulator_(config.simulated_prompt)
    , history_chunks_(config.history_chunks < 0 ? 0 : static_cast<size_t>(config.history_chunks))
    , system_prompt_(config.system_prompt)
    , xml_tag_(config.xml_tag) {

    params_.model = config.model;
    params_.temperature = config.temperature;
    params_.max_tokens = config.response_tokens;
}

std::vector<std::string> StorySession::get_canon() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return canon_;
}

std::string StorySession::get_pending_narrative() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_narrative_;
}

std::string StorySession::get_thinking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thinking_;
}

bool StorySession::is_dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

std::string StorySession::get_story_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> parts = canon_;
    if (!pending_narrative_.empty()) {
        parts.push_back(pending_narrative_);
    }
    return join_canon_text(parts);
}

void StorySession::edit_narrative(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_narrative_ = text;
    dirty_ = !text.empty();
    edited_ = true;
}

bool StorySession::commit_narrative() {
    std::lock_guard<std::mutex> lock(mutex_);
    return commit_narrative_locked();
}

bool StorySession::commit_narrative_locked() {
    if (pending_narrative_.empty()) {
        LOG_DEBUG("Commit skipped: no pending narrative");
        return false;
    }

    // Keep memory in step with a hand-edited narrative
    if (edited_) {
        memory_->replace_last_assistant(pending_narrative_);
    }

    canon_.push_back(pending_narrative_);
    memory_->commit_proposal();

    pending_narrative_.clear();
    thinking_.clear();
    dirty_ = false;
    edited_ = false;

    LOG_INFO_FMT("Committed narrative, canon now {} chunks", canon_.size());
    return true;
}

bool StorySession::discard_narrative() {
    std::lock_guard<std::mutex> lock(mutex_);
    return discard_narrative_locked();
}

bool StorySession::discard_narrative_locked() {
    if (pending_narrative_.empty() && !dirty_ && !memory_->has_pending_proposal()) {
        LOG_DEBUG("Discard skipped: nothing pending");
        return false;
    }

    memory_->discard_proposal();

    pending_narrative_.clear();
    thinking_.clear();
    dirty_ = false;
    edited_ = false;

    LOG_INFO("Discarded pending narrative");
    return true;
}

Response StorySession::continue_story(const std::string& guidance, const ModelInvoker& invoker) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dirty_) {
            commit_narrative_locked();
        }
    }
    return generate(guidance, invoker);
}

Response StorySession::rewrite(const std::string& guidance, const ModelInvoker& invoker) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discard_narrative_locked();
    }
    return generate(guidance, invoker);
}

std::string StorySession::wrap_guidance(const std::string& guidance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wrap_guidance_locked(guidance);
}

std::string StorySession::wrap_guidance_locked(const std::string& guidance) const {
    if (guidance.empty()) {
        return DEFAULT_GUIDANCE;
    }

    // "<instruction attr>" -> "instruction"
    std::string tag;
    for (char c : xml_tag_) {
        if (c == '<' || c == '>') continue;
        if (c == ' ' || c == '\t') {
            if (!tag.empty()) break;
            continue;
        }
        tag += c;
    }
    if (tag.empty()) {
        return guidance;
    }
    return "<" + tag + ">" + guidance + "</" + tag + ">";
}

Response StorySession::generate(const std::string& guidance, const ModelInvoker& invoker) {
    std::string prompt;
    std::string system_prompt;
    GenerationParams params;
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompt = wrap_guidance_locked(guidance);
        system_prompt = system_prompt_;
        params = params_;
        epoch = story_epoch_;
    }

    // Freeze and snapshot in one step so the request is exactly the committed baseline
    std::vector<Message> request = memory_->prepare_for_response();
    request.emplace_back(Message::USER, prompt);
    int request_tokens = count_sequence_tokens(memory_->get_tokenizer(), request);

    LOG_INFO_FMT("Invoking model with {} messages ({} tokens), guidance: '{}'",
                 request.size(), request_tokens, inkwell::preview(prompt, 50));

    Response response;
    if (!invoker) {
        response.success = false;
        response.error = "No model client configured";
        response.finish_reason = "error";
    } else {
        try {
            response = invoker(system_prompt, request, params);
        } catch (const std::exception& e) {
            response = Response();
            response.success = false;
            response.error = e.what();
            response.finish_reason = "error";
        }
    }
    if (response.prompt_tokens == 0) {
        response.prompt_tokens = request_tokens;
    }

    if (!response.success) {
        // The store is left exactly as the caller last made it
        LOG_ERROR_FMT("Model invocation failed: {}", response.error);
        return response;
    }

    ParsedResponse parsed = parse_model_response(response.content);

    std::lock_guard<std::mutex> lock(mutex_);
    if (epoch != story_epoch_) {
        LOG_WARN("Story was replaced while generating, response not applied");
        response.success = false;
        response.error = "Story was replaced while the response was generated";
        response.finish_reason = "cancelled";
        return response;
    }

    memory_->add_messages({Message(Message::USER, prompt), Message(Message::ASSISTANT, parsed.narrative)});

    pending_narrative_ = parsed.narrative;
    thinking_ = parsed.thinking;
    dirty_ = !pending_narrative_.empty();
    edited_ = false;

    LOG_DEBUG_FMT("Generated {} chars of narrative{}", parsed.narrative.length(),
                  parsed.thinking.empty() ? "" : " with reasoning");
    return response;
}

std::future<Response> StorySession::generate_async(const std::string& guidance, ModelInvoker invoker) {
    return std::async(std::launch::async, [this, guidance, invoker]() {
        return generate(guidance, invoker);
    });
}

void StorySession::clear_story_locked() {
    ++story_epoch_;
    canon_.clear();
    pending_narrative_.clear();
    thinking_.clear();
    dirty_ = false;
    edited_ = false;
    current_file_.clear();
    memory_->clear();
}

void StorySession::new_story() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_story_locked();
    LOG_INFO("Started new story");
}

void StorySession::load_story(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StoryError("Failed to open story file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StoryError("Failed to read story file: " + path);
    }

    std::vector<std::string> chunks = split_canon_text(buffer.str());

    std::lock_guard<std::mutex> lock(mutex_);
    clear_story_locked();
    current_file_ = path;

    if (chunks.empty()) {
        LOG_WARN_FMT("Loaded file is empty or contains only whitespace: {}", path);
        return;
    }

    // All chunks are canon; only the tail seeds conversation memory
    canon_ = chunks;
    simulator_.seed(*memory_, canon_, history_chunks_);

    LOG_INFO_FMT("Story loaded from {} ({} chunks)", path, canon_.size());
}

void StorySession::save_story(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string target = path.empty() ? current_file_ : path;
    if (target.empty()) {
        throw StoryError("No file name given for saving the story");
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StoryError("Failed to create story file: " + target);
    }
    file << join_canon_text(canon_);
    file.close();
    if (file.fail()) {
        throw StoryError("Failed to write story file: " + target);
    }

    current_file_ = target;
    LOG_INFO_FMT("Story canon saved to {}", target);
}

std::string StorySession::get_current_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_;
}

void StorySession::set_max_tokens(int max_tokens) {
    memory_->set_max_tokens(max_tokens);
}

void StorySession::set_history_chunks(size_t chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_chunks_ = chunks;
}

void StorySession::set_system_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    system_prompt_ = prompt;
}

void StorySession::set_xml_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    xml_tag_ = tag;
}

void StorySession::set_generation_params(const GenerationParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_ = params;
}

GenerationParams StorySession::get_generation_params() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}
