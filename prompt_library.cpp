#include "inkwell.h"
#include "prompt_library.h"
#include "config.h"
#include "system_prompt.h"

#include <fstream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <ctime>

PromptLibrary::PromptLibrary(const std::string& path)
    : path_(path.empty() ? get_default_path() : path) {
    set_defaults();
}

std::string PromptLibrary::get_default_path() {
    std::filesystem::path config_dir = std::filesystem::path(Config::get_default_config_path()).parent_path();
    return (config_dir / FILE_NAME).string();
}

std::string PromptLibrary::now_iso() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

void PromptLibrary::set_defaults() {
    std::string now = now_iso();
    prompts_.clear();
    prompts_[DEFAULT_PROMPT_NAME] = PromptEntry{SYSTEM_PROMPT, now, now};
    active_ = DEFAULT_PROMPT_NAME;
}

void PromptLibrary::load() {
    LOG_DEBUG_FMT("Loading prompts from: {}", path_);

    if (!std::filesystem::exists(path_)) {
        LOG_INFO_FMT("Prompt file not found, creating default: {}", path_);
        set_defaults();
        save_or_warn();
        return;
    }

    nlohmann::json j;
    try {
        std::ifstream file(path_);
        if (!file.is_open()) {
            throw PromptLibraryError("Failed to open prompt file: " + path_);
        }
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN_FMT("Invalid JSON in prompt file {} ({}), resetting to default", path_, e.what());
        set_defaults();
        save_or_warn();
        return;
    }

    if (!j.is_object() || !j.contains("active_prompt") || !j["active_prompt"].is_string() ||
        !j.contains("prompts") || !j["prompts"].is_object()) {
        LOG_WARN_FMT("Prompt file {} has an invalid structure, resetting to default", path_);
        set_defaults();
        save_or_warn();
        return;
    }

    prompts_.clear();
    for (const auto& el : j["prompts"].items()) {
        const std::string& name = el.key();
        const nlohmann::json& item = el.value();
        if (!item.is_object() || !item.contains("content") || !item["content"].is_string()) {
            LOG_WARN_FMT("Skipping prompt '{}' without string content", name);
            continue;
        }
        PromptEntry entry;
        entry.content = item["content"].get<std::string>();
        if (item.contains("created_at") && item["created_at"].is_string()) {
            entry.created_at = item["created_at"].get<std::string>();
        }
        if (item.contains("last_used") && item["last_used"].is_string()) {
            entry.last_used = item["last_used"].get<std::string>();
        }
        prompts_[name] = entry;
    }
    active_ = j["active_prompt"].get<std::string>();

    LOG_DEBUG_FMT("Loaded {} prompts, active '{}'", prompts_.size(), active_);
}

nlohmann::json PromptLibrary::to_json() const {
    nlohmann::json prompts = nlohmann::json::object();
    for (const auto& [name, entry] : prompts_) {
        prompts[name] = {
            {"content", entry.content},
            {"created_at", entry.created_at},
            {"last_used", entry.last_used}
        };
    }
    return nlohmann::json{{"active_prompt", active_}, {"prompts", prompts}};
}

void PromptLibrary::save() const {
    try {
        std::filesystem::path dir = std::filesystem::path(path_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(path_);
        if (!file.is_open()) {
            throw PromptLibraryError("Failed to create prompt file: " + path_);
        }
        file << to_json().dump(2) << std::endl;
        if (file.fail()) {
            throw PromptLibraryError("Failed to write prompt file: " + path_);
        }
        LOG_DEBUG_FMT("Saved {} prompts to: {}", prompts_.size(), path_);

    } catch (const PromptLibraryError&) {
        throw;
    } catch (const std::exception& e) {
        throw PromptLibraryError("Error saving prompts: " + std::string(e.what()));
    }
}

void PromptLibrary::save_or_warn() const {
    // The in-memory library stays usable when the file cannot be written
    try {
        save();
    } catch (const PromptLibraryError& e) {
        LOG_WARN(e.what());
    }
}

std::vector<std::string> PromptLibrary::get_prompt_names() const {
    std::vector<std::string> names;
    names.reserve(prompts_.size());
    for (const auto& entry : prompts_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string PromptLibrary::get_active_prompt_name() {
    if (prompts_.count(active_)) {
        return active_;
    }

    LOG_WARN_FMT("Active prompt '{}' not found, falling back to '{}'", active_, DEFAULT_PROMPT_NAME);
    active_ = DEFAULT_PROMPT_NAME;
    save_or_warn();
    return active_;
}

bool PromptLibrary::set_active_prompt(const std::string& name) {
    auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        LOG_WARN_FMT("Cannot activate unknown prompt '{}'", name);
        return false;
    }

    active_ = name;
    it->second.last_used = now_iso();
    save();
    LOG_INFO_FMT("Active prompt set to '{}'", name);
    return true;
}

std::optional<PromptEntry> PromptLibrary::get_prompt(const std::string& name) const {
    auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string PromptLibrary::get_active_prompt_content() {
    std::optional<PromptEntry> entry = get_prompt(get_active_prompt_name());
    return entry ? entry->content : std::string(SYSTEM_PROMPT);
}

bool PromptLibrary::save_prompt(const std::string& name, const std::string& content) {
    if (name.empty()) {
        LOG_WARN("Prompt name cannot be empty");
        return false;
    }

    std::string now = now_iso();
    auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        prompts_[name] = PromptEntry{content, now, now};
        LOG_INFO_FMT("Prompt '{}' created", name);
    } else {
        it->second.content = content;
        it->second.last_used = now;
        LOG_INFO_FMT("Prompt '{}' updated", name);
    }

    save();
    return true;
}

bool PromptLibrary::delete_prompt(const std::string& name) {
    if (name == DEFAULT_PROMPT_NAME) {
        LOG_WARN("Cannot delete the default prompt");
        return false;
    }
    if (prompts_.erase(name) == 0) {
        LOG_WARN_FMT("Prompt '{}' not found for deletion", name);
        return false;
    }

    if (active_ == name) {
        active_ = DEFAULT_PROMPT_NAME;
        LOG_INFO_FMT("Active prompt reset to '{}'", DEFAULT_PROMPT_NAME);
    }

    save();
    LOG_INFO_FMT("Prompt '{}' deleted", name);
    return true;
}

int handle_prompt_args(PromptLibrary& library, const std::vector<std::string>& args,
                       std::function<void(const std::string&)> callback) {
    if (!args.empty() && (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
        callback("Usage: inkwell prompts [subcommand]\n"
            "Subcommands:\n"
            "  list                  - List prompts (* marks the active one)\n"
            "  show [name]           - Print a prompt (default: active)\n"
            "  use <name>            - Make a prompt active\n"
            "  set <name> <content>  - Create or update a prompt\n"
            "  delete <name>         - Delete a prompt\n");
        return 0;
    }

    try {
        if (args.empty() || args[0] == "list") {
            std::string active = library.get_active_prompt_name();
            for (const auto& name : library.get_prompt_names()) {
                callback((name == active ? "* " : "  ") + name + "\n");
            }
            return 0;
        }

        if (args[0] == "show") {
            std::string name = args.size() >= 2 ? args[1] : library.get_active_prompt_name();
            std::optional<PromptEntry> entry = library.get_prompt(name);
            if (!entry) {
                callback("Prompt not found: " + name + "\n");
                return 1;
            }
            callback("=== " + name + " ===\n" + entry->content + "\n");
            return 0;
        }

        if (args[0] == "use" && args.size() >= 2) {
            if (!library.set_active_prompt(args[1])) {
                callback("Prompt not found: " + args[1] + "\n");
                return 1;
            }
            callback("Active prompt: " + args[1] + "\n");
            return 0;
        }

        if (args[0] == "set" && args.size() >= 3) {
            if (!library.save_prompt(args[1], args[2])) {
                callback("Prompt name cannot be empty\n");
                return 1;
            }
            callback("Prompt saved: " + args[1] + "\n");
            return 0;
        }

        if (args[0] == "delete" && args.size() >= 2) {
            if (!library.delete_prompt(args[1])) {
                callback("Cannot delete prompt: " + args[1] + "\n");
                return 1;
            }
            callback("Prompt deleted: " + args[1] + "\n");
            return 0;
        }
    } catch (const PromptLibraryError& e) {
        callback(std::string(e.what()) + "\n");
        return 1;
    }

    callback("Unknown prompts subcommand: " + args[0] + "\n");
    callback("Available: list, show, use, set, delete\n");
    return 1;
}
