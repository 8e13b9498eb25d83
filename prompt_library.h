#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <stdexcept>
#include "nlohmann/json.hpp"

class PromptLibraryError : public std::runtime_error {
public:
    explicit PromptLibraryError(const std::string& message) : std::runtime_error(message) {}
};

struct PromptEntry {
    std::string content;
    std::string created_at;         // ISO-8601 local time
    std::string last_used;
};

/// @brief Named system prompts with one active entry, persisted as JSON
///
/// File layout:
///   {"active_prompt": "<name>", "prompts": {"<name>": {"content", "created_at", "last_used"}}}
///
/// The built-in prompt (DEFAULT_PROMPT_NAME) is created when the file is missing or
/// unusable and can never be deleted. Every mutation is written back immediately.
class PromptLibrary {
public:
    static constexpr const char* DEFAULT_PROMPT_NAME = "Narrative Writer";
    static constexpr const char* FILE_NAME = "system_prompts.json";

    /// Empty path means get_default_path()
    explicit PromptLibrary(const std::string& path = "");

    /// Read the file. A missing file, invalid JSON or a wrong top-level structure
    /// resets to the built-in prompt and writes it out; unusable entries are skipped.
    void load();

    /// @throws PromptLibraryError if the file cannot be written
    void save() const;

    /// Sorted by name
    std::vector<std::string> get_prompt_names() const;

    /// Falls back to (and persists) the default when the active name no longer exists
    std::string get_active_prompt_name();

    /// @return false if no prompt has that name
    bool set_active_prompt(const std::string& name);

    std::optional<PromptEntry> get_prompt(const std::string& name) const;

    /// Content of the active prompt, or the built-in text if even the default is gone
    std::string get_active_prompt_content();

    /// Create or update; @return false for an empty name
    bool save_prompt(const std::string& name, const std::string& content);

    /// @return false for the default prompt or an unknown name
    bool delete_prompt(const std::string& name);

    const std::string& get_path() const { return path_; }

    /// $XDG_CONFIG_HOME/inkwell/system_prompts.json (or ~/.config/inkwell/...)
    static std::string get_default_path();

private:
    void set_defaults();
    void save_or_warn() const;
    nlohmann::json to_json() const;
    static std::string now_iso();

    std::string path_;
    std::string active_;
    std::map<std::string, PromptEntry> prompts_;
};

// "inkwell prompts [list|show|use|set|delete]"
int handle_prompt_args(PromptLibrary& library, const std::vector<std::string>& args,
                       std::function<void(const std::string&)> callback);
