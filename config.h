#pragma once

#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include "nlohmann/json.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    Config();

    // Load configuration from $XDG_CONFIG_HOME/inkwell/config.json
    // A missing file leaves defaults in place
    void load();

    // Save current configuration
    void save() const;

    // Range checks; throws ConfigError
    void validate() const;

    // Get user's home directory (tries HOME first, then getpwuid)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Set a single key from its string form (used by "inkwell config set")
    void set_value(const std::string& key, const std::string& value);

    // Conversation memory
    int max_tokens;                 // Token budget for conversation history
    int history_chunks;             // Chunks replayed into memory on story load
    std::string simulated_prompt;   // User-side placeholder for replayed chunks

    // Generation
    std::string system_prompt;
    std::string model;
    double temperature;
    int response_tokens;            // Max tokens for a single model response
    std::string xml_tag;            // Optional tag wrapped around guidance, e.g. "instruction"

    // Logging
    std::string log_level;
    std::string log_file;

    nlohmann::json json;  // Parsed config JSON as loaded

private:
    std::string get_config_path() const;
    void set_defaults();

    std::string custom_config_path_;
};

// Parse a whole string as an int; throws ConfigError naming key on trailing junk or overflow
int parse_int_value(const std::string& key, const std::string& value);

// Common config command implementation ("show" / "set <key> <value>")
int handle_config_args(Config& cfg, const std::vector<std::string>& args,
                       std::function<void(const std::string&)> callback);
