#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <cstdint>
#include <stdexcept>
#include "config.h"
#include "history_store.h"
#include "history_simulator.h"
#include "model_invoker.h"
#include "tokenizer.h"

class StoryError : public std::runtime_error {
public:
    explicit StoryError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief One open story: canon text, the pending narrative ("blue text") and its memory
///
/// Generation flow:
///   1. memory().prepare_for_response() freezes what is about to be sent
///   2. a private snapshot of the active history (plus the guidance) goes to the model,
///      with no lock held
///   3. on success the guidance and the narrative are appended as a proposal and the
///      narrative becomes the pending blue text
///   4. commit_narrative() promotes both to canon/committed; discard_narrative() reverts
///
/// Mutations made while a call is in flight land in the store and survive; the late
/// result is appended after them. A failed call leaves the store untouched.
///
/// The memory warning callback runs while the session lock is held and must not call
/// back into the session.
class StorySession {
public:
    static constexpr const char* DEFAULT_GUIDANCE = "Continue the story.";

    StorySession(const Config& config, std::shared_ptr<Tokenizer> tokenizer);

    StorySession(const StorySession&) = delete;
    StorySession& operator=(const StorySession&) = delete;

    /// The store outlives every load/new story; only its contents are reset
    HistoryStore& memory() { return *memory_; }
    const HistoryStore& memory() const { return *memory_; }

    // Story state
    std::vector<std::string> get_canon() const;
    std::string get_pending_narrative() const;
    std::string get_thinking() const;
    bool is_dirty() const;

    /// @brief Canon plus the pending narrative, blank-line separated
    std::string get_story_text() const;

    // Blue text actions

    /// @brief Replace the pending narrative with user-edited text
    void edit_narrative(const std::string& text);

    /// @brief Append the pending narrative to canon and commit the memory proposal
    /// @return false if there was nothing to commit
    bool commit_narrative();

    /// @brief Drop the pending narrative and the memory proposal
    /// @return false if there was nothing to discard
    bool discard_narrative();

    // Generation

    /// @brief Commit any pending narrative, then generate the next section
    Response continue_story(const std::string& guidance, const ModelInvoker& invoker);

    /// @brief Discard any pending narrative, then generate a replacement
    Response rewrite(const std::string& guidance, const ModelInvoker& invoker);

    /// @brief Run one model call against a snapshot of memory
    Response generate(const std::string& guidance, const ModelInvoker& invoker);

    /// @brief generate() on a worker thread; the session must outlive the future
    std::future<Response> generate_async(const std::string& guidance, ModelInvoker invoker);

    /// @brief Apply the optional XML tag to guidance; empty guidance becomes DEFAULT_GUIDANCE
    std::string wrap_guidance(const std::string& guidance) const;

    // Story files

    void new_story();

    /// @brief Load plain text: every chunk becomes canon, the tail seeds memory
    /// @throws StoryError if the file cannot be read
    void load_story(const std::string& path);

    /// @brief Write canon (not the pending narrative); empty path means the current file
    /// @throws StoryError if no path is known or the file cannot be written
    void save_story(const std::string& path = "");

    std::string get_current_file() const;

    // Settings

    /// @throws HistoryStoreError if max_tokens < 1
    void set_max_tokens(int max_tokens);
    void set_history_chunks(size_t chunks);
    void set_system_prompt(const std::string& prompt);
    void set_xml_tag(const std::string& tag);
    void set_generation_params(const GenerationParams& params);
    GenerationParams get_generation_params() const;

private:
    std::string wrap_guidance_locked(const std::string& guidance) const;
    bool commit_narrative_locked();
    bool discard_narrative_locked();
    void clear_story_locked();

    mutable std::mutex mutex_;

    std::unique_ptr<HistoryStore> memory_;
    HistorySimulator simulator_;
    size_t history_chunks_;

    std::vector<std::string> canon_;
    std::string pending_narrative_;
    std::string thinking_;
    bool dirty_ = false;
    bool edited_ = false;

    std::string system_prompt_;
    std::string xml_tag_;
    GenerationParams params_;
    std::string current_file_;

    // Bumped by new_story/load_story so a result from a replaced story is not appended
    uint64_t story_epoch_ = 0;
};
