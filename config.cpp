#include "inkwell.h"
#include "config.h"
#include "history_simulator.h"
#include "history_store.h"
#include "nlohmann/json.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

// include the default system prompt
#include "system_prompt.h"

using json = nlohmann::json;

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    max_tokens = HistoryStore::DEFAULT_MAX_TOKENS;
    history_chunks = static_cast<int>(HistorySimulator::DEFAULT_MAX_CHUNKS);
    simulated_prompt = HistorySimulator::DEFAULT_PROMPT;

    system_prompt = SYSTEM_PROMPT;
    model = "";
    temperature = 0.7;
    response_tokens = 1024;
    xml_tag = "";

    log_level = "warn";
    log_file = "";
}

std::string Config::get_home_directory() {
    // Try HOME environment variable first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    // Fallback to system passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/inkwell/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    LOG_DEBUG_FMT("Loading config from: {}", config_path);

    if (!std::filesystem::exists(config_path)) {
        LOG_DEBUG_FMT("Config file not found, using defaults: {}", config_path);
        return;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path);
        }

        file >> json;

        if (!json.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + config_path);
        }

        // Memory settings
        if (json.contains("max_tokens")) {
            max_tokens = json["max_tokens"].get<int>();
        }
        if (json.contains("history_chunks")) {
            history_chunks = json["history_chunks"].get<int>();
        }
        if (json.contains("simulated_prompt")) {
            simulated_prompt = json["simulated_prompt"].get<std::string>();
        }

        // Generation settings
        if (json.contains("system")) {
            system_prompt = json["system"].get<std::string>();
        }
        if (json.contains("model")) {
            model = json["model"].get<std::string>();
        }
        if (json.contains("temperature")) {
            temperature = json["temperature"].get<double>();
        }
        if (json.contains("response_tokens")) {
            response_tokens = json["response_tokens"].get<int>();
        }
        if (json.contains("xml_tag")) {
            xml_tag = json["xml_tag"].get<std::string>();
        }

        // Logging
        if (json.contains("log_level")) {
            log_level = json["log_level"].get<std::string>();
        }
        if (json.contains("log_file")) {
            log_file = json["log_file"].get<std::string>();
        }

        LOG_DEBUG_FMT("Loaded configuration from: {}", config_path);

    } catch (const ConfigError&) {
        throw;
    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw ConfigError("Error loading config: " + std::string(e.what()));
    }
}

void Config::save() const {
    std::string config_path = get_config_path();

    try {
        // Create directory if it doesn't exist
        std::filesystem::path dir = std::filesystem::path(config_path).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        nlohmann::json save_json = {
            {"max_tokens", max_tokens},
            {"history_chunks", history_chunks},
            {"simulated_prompt", simulated_prompt},
            {"temperature", temperature},
            {"response_tokens", response_tokens},
            {"log_level", log_level}
        };

        // Optional fields
        if (system_prompt != SYSTEM_PROMPT) {
            save_json["system"] = system_prompt;
        }
        if (!model.empty()) {
            save_json["model"] = model;
        }
        if (!xml_tag.empty()) {
            save_json["xml_tag"] = xml_tag;
        }
        if (!log_file.empty()) {
            save_json["log_file"] = log_file;
        }

        std::ofstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to create config file: " + config_path);
        }

        file << save_json.dump(4) << std::endl;
        LOG_DEBUG_FMT("Saved configuration to: {}", config_path);

    } catch (const ConfigError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Error creating JSON: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw ConfigError("Error saving config: " + std::string(e.what()));
    }
}

void Config::validate() const {
    if (max_tokens < 1) {
        throw ConfigError("max_tokens must be at least 1 (got " + std::to_string(max_tokens) + ")");
    }
    if (history_chunks < 0) {
        throw ConfigError("history_chunks cannot be negative (got " + std::to_string(history_chunks) + ")");
    }
    if (temperature < 0.0 || temperature > 2.0) {
        throw ConfigError("temperature must be between 0.0 and 2.0");
    }
    if (response_tokens < 50 || response_tokens > 8192) {
        throw ConfigError("response_tokens must be between 50 and 8192 (got " +
                          std::to_string(response_tokens) + ")");
    }
    LogLevel level;
    if (!Logger::parse_level(log_level, level)) {
        throw ConfigError("Unknown log_level: " + log_level);
    }

    LOG_DEBUG("Configuration validation passed");
}

int parse_int_value(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.length()) {
            throw ConfigError("Invalid integer for " + key + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

void Config::set_value(const std::string& key, const std::string& value) {
    if (key == "max_tokens") {
        max_tokens = parse_int_value(key, value);
    } else if (key == "history_chunks") {
        history_chunks = parse_int_value(key, value);
    } else if (key == "simulated_prompt") {
        simulated_prompt = value;
    } else if (key == "system") {
        system_prompt = value;
    } else if (key == "model") {
        model = value;
    } else if (key == "temperature") {
        try {
            temperature = std::stod(value);
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid number for temperature: " + value);
        }
    } else if (key == "response_tokens") {
        response_tokens = parse_int_value(key, value);
    } else if (key == "xml_tag") {
        xml_tag = value;
    } else if (key == "log_level") {
        log_level = value;
    } else if (key == "log_file") {
        log_file = value;
    } else {
        throw ConfigError("Unknown config key: " + key);
    }
}

int handle_config_args(Config& cfg, const std::vector<std::string>& args,
                       std::function<void(const std::string&)> callback) {
    // Help
    if (!args.empty() && (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
        callback("Usage: inkwell config [subcommand]\n"
            "Subcommands:\n"
            "  show              - Show all config values\n"
            "  set <key> <value> - Set config value\n"
            "  (no args)         - Show all config values\n"
            "Keys: max_tokens, history_chunks, simulated_prompt, system, model,\n"
            "      temperature, response_tokens, xml_tag, log_level, log_file\n");
        return 0;
    }

    // No args or "show" displays configuration
    if (args.empty() || args[0] == "show") {
        callback("=== Inkwell Configuration ===\n");
        callback("max_tokens = " + std::to_string(cfg.max_tokens) + "\n");
        callback("history_chunks = " + std::to_string(cfg.history_chunks) + "\n");
        callback("simulated_prompt = " + cfg.simulated_prompt + "\n");
        callback("system = " + inkwell::preview(cfg.system_prompt) + "\n");
        callback("model = " + cfg.model + "\n");
        callback("temperature = " + std::to_string(cfg.temperature) + "\n");
        callback("response_tokens = " + std::to_string(cfg.response_tokens) + "\n");
        callback("xml_tag = " + cfg.xml_tag + "\n");
        callback("log_level = " + cfg.log_level + "\n");
        callback("log_file = " + cfg.log_file + "\n");
        return 0;
    }

    if (args[0] == "set" && args.size() >= 3) {
        const std::string& key = args[1];
        const std::string& value = args[2];

        // Only a value that validates and saves reaches cfg
        Config updated = cfg;
        try {
            updated.set_value(key, value);
            updated.validate();
            updated.save();
        } catch (const ConfigError& e) {
            callback(std::string(e.what()) + "\n");
            return 1;
        }
        cfg = updated;

        callback("Config updated: " + key + " = " + value + "\n");
        return 0;
    }

    callback("Unknown config subcommand: " + args[0] + "\n");
    callback("Available: show, set\n");
    return 1;
}
