#pragma once

#include <string>
#include <iostream>
#include <stdexcept>
#include "nlohmann/json.hpp"

/// @brief Represents a single message in the conversation memory
/// Immutable once constructed; sequences hold copies, never shared references
class Message {
public:
	/// Closed set of roles kept in conversation memory
	enum Role {
		USER,           // Guidance from the writer (or a simulated prompt)
		ASSISTANT       // Narrative produced by the model
	};

	Message(Role r, const std::string& c) : role_(r), content_(c) {}

	Role role() const { return role_; }
	const std::string& content() const { return content_; }

	bool is_user() const { return role_ == USER; }
	bool is_assistant() const { return role_ == ASSISTANT; }

	/// Convert role string to Role enum
	/// Accepts "user"/"assistant" and the "human"/"ai" aliases used by chat toolkits
	/// @throws std::invalid_argument for any other string
	static Role stringToRole(const std::string& roleStr) {
		if (roleStr == "user" || roleStr == "human") return USER;
		if (roleStr == "assistant" || roleStr == "ai") return ASSISTANT;
		throw std::invalid_argument("Unknown message role: '" + roleStr + "'");
	}

	// Get standardized role string (as sent to chat APIs)
	std::string get_role() const {
		switch (role_) {
			case USER: return "user";
			case ASSISTANT: return "assistant";
		}
		return "user";
	}

	nlohmann::json to_json() const {
		return nlohmann::json{{"role", get_role()}, {"content", content_}};
	}

	/// @throws std::invalid_argument if the object lacks a string role/content
	static Message from_json(const nlohmann::json& j) {
		if (!j.is_object() || !j.contains("role") || !j["role"].is_string() ||
		    !j.contains("content") || !j["content"].is_string()) {
			throw std::invalid_argument("Message JSON must be an object with string 'role' and 'content'");
		}
		return Message(stringToRole(j["role"].get<std::string>()), j["content"].get<std::string>());
	}

	bool operator==(const Message& other) const {
		return role_ == other.role_ && content_ == other.content_;
	}

	bool operator!=(const Message& other) const {
		return !(*this == other);
	}

private:
	Role role_;
	std::string content_;
};

inline std::ostream& operator<<(std::ostream& os, const Message& msg) {
	os << msg.get_role() << ": ";
	if (msg.content().length() > 100) {
		os << msg.content().substr(0, 100) << "...";
	} else {
		os << msg.content();
	}
	return os;
}
