#include "inkwell.h"
#include "config.h"
#include "history_store.h"
#include "prompt_library.h"
#include "story_session.h"
#include "tokenizer.h"
#include "truncation_policy.h"

#include <getopt.h>
#include <cstdio>
#include <cstdlib>

// Global debug level (0=off, 1-9=increasing verbosity)
// Used by dprintf() macro in debug.h for fine-grained debug control
int g_debug_level = 0;

static void print_usage(int, char** argv) {
	printf("\n=== Inkwell - conversation memory for chat-assisted writing ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS] <story-file>		Load a story and show the seeded context\n", argv[0]);
	printf("	%s config <show|set> [args...]\n", argv[0]);
	printf("	%s prompts <list|show|use|set|delete> [args...]\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-c, --config FILE	Specify config file (default: ~/.config/inkwell/config.json)\n");
	printf("	-d, --debug[=N]		Enable debug mode with optional level (1-9, default: 1)\n");
	printf("	-l, --log-file FILE	Also log to FILE\n");
	printf("	-t, --max-tokens N	Conversation memory budget in tokens (overrides config)\n");
	printf("	-n, --chunks N		Chunks replayed into memory on load (overrides config)\n");
	printf("	--tokenizer NAME	Token counter: estimate (default) or words\n");
	printf("	-j, --json		Print the memory state as JSON\n");
	printf("	-v, --version		Show version information\n");
	printf("	-h, --help		Show this help message\n");
	printf("\n");
}

static int handle_config_subcommand(Config& cfg, int argc, char** argv, int first) {
	std::vector<std::string> args;
	for (int i = first; i < argc; i++) {
		args.push_back(argv[i]);
	}

	return handle_config_args(cfg, args, [](const std::string& msg) {
		std::cout << msg;
	});
}

static int handle_prompts_subcommand(int argc, char** argv, int first) {
	std::vector<std::string> args;
	for (int i = first; i < argc; i++) {
		args.push_back(argv[i]);
	}

	PromptLibrary library;
	try {
		library.load();
	} catch (const PromptLibraryError& e) {
		fprintf(stderr, "Error: %s\n", e.what());
		return 1;
	}

	return handle_prompt_args(library, args, [](const std::string& msg) {
		std::cout << msg;
	});
}

static void print_context(const StorySession& session) {
	const HistoryStore& memory = session.memory();
	std::vector<Message> messages = memory.active_messages();

	printf("Canon Chunks: %zu | History: %zu msgs / %d tokens (limit %d)\n",
	       session.get_canon().size(), messages.size(),
	       memory.get_token_count(), memory.get_max_tokens());
	printf("--- Context History ---\n");

	Tokenizer& tokenizer = memory.get_tokenizer();
	for (size_t i = 0; i < messages.size(); i++) {
		const Message& msg = messages[i];
		printf("[%zu] %-9s (%4d tokens) %s\n", i + 1, msg.get_role().c_str(),
		       count_message_tokens(tokenizer, msg), inkwell::preview(msg.content(), 70).c_str());
	}
}

int main(int argc, char** argv) {
	std::string config_file_path;
	std::string log_file;
	std::string tokenizer_name = "estimate";
	bool json_output = false;

	// Command-line overrides (applied to config after load)
	struct {
		int max_tokens = -1;        // -1 = not specified
		int chunks = -1;            // -1 = not specified
	} override;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"max-tokens", required_argument, 0, 't'},
		{"chunks", required_argument, 0, 'n'},
		{"tokenizer", required_argument, 0, 1000},
		{"json", no_argument, 0, 'j'},
		{"version", no_argument, 0, 'v'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	// '+' stops at the first non-option so "config set ..." keeps its own arguments
	while ((opt = getopt_long(argc, argv, "+c:d::l:t:n:jvh", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'c':
				config_file_path = optarg;
				break;
			case 'd':
				try {
					g_debug_level = optarg ? parse_int_value("--debug", optarg) : 1;
				} catch (const ConfigError& e) {
					fprintf(stderr, "Error: %s\n", e.what());
					return 1;
				}
				break;
			case 'l':
				log_file = optarg;
				break;
			case 't':
				try {
					override.max_tokens = parse_int_value("--max-tokens", optarg);
				} catch (const ConfigError& e) {
					fprintf(stderr, "Error: %s\n", e.what());
					return 1;
				}
				if (override.max_tokens < 1) {
					fprintf(stderr, "Error: max-tokens must be at least 1\n");
					return 1;
				}
				break;
			case 'n':
				try {
					override.chunks = parse_int_value("--chunks", optarg);
				} catch (const ConfigError& e) {
					fprintf(stderr, "Error: %s\n", e.what());
					return 1;
				}
				if (override.chunks < 0) {
					fprintf(stderr, "Error: chunks cannot be negative\n");
					return 1;
				}
				break;
			case 1000: // --tokenizer
				tokenizer_name = optarg;
				break;
			case 'j':
				json_output = true;
				break;
			case 'v':
				printf("Inkwell version %s\n", inkwell::VERSION);
				return 0;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	Logger& logger = Logger::instance();
	logger.set_log_level(LogLevel::WARN);

	Config config;
	if (!config_file_path.empty()) {
		config.set_config_path(config_file_path);
	}

	try {
		config.load();
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	// Handle config subcommand
	if (optind < argc && std::string(argv[optind]) == "config") {
		return handle_config_subcommand(config, argc, argv, optind + 1);
	}
	if (optind < argc && std::string(argv[optind]) == "prompts") {
		return handle_prompts_subcommand(argc, argv, optind + 1);
	}

	if (override.max_tokens > 0) {
		config.max_tokens = override.max_tokens;
	}
	if (override.chunks >= 0) {
		config.history_chunks = override.chunks;
	}

	try {
		config.validate();
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	LogLevel level;
	if (Logger::parse_level(config.log_level, level)) {
		logger.set_log_level(level);
	}
	if (g_debug_level) {
		logger.set_log_level(LogLevel::DEBUG);
		LOG_DEBUG_FMT("Debug mode enabled (level {})", g_debug_level);
	}
	if (log_file.empty()) {
		log_file = config.log_file;
	}
	if (!log_file.empty()) {
		logger.set_log_file(log_file);
	}

	if (optind >= argc) {
		print_usage(argc, argv);
		return 1;
	}
	std::string story_path = argv[optind];

	// An explicit "system" in config.json wins over the prompt library
	if (!config.json.contains("system")) {
		PromptLibrary library;
		try {
			library.load();
			config.system_prompt = library.get_active_prompt_content();
			LOG_DEBUG_FMT("Using system prompt '{}'", library.get_active_prompt_name());
		} catch (const PromptLibraryError& e) {
			fprintf(stderr, "Error: %s\n", e.what());
			return 1;
		}
	}

	std::shared_ptr<Tokenizer> tokenizer;
	if (tokenizer_name == "estimate") {
		tokenizer = std::make_shared<EstimatingTokenizer>();
	} else if (tokenizer_name == "words") {
		tokenizer = std::make_shared<WordTokenizer>();
	} else {
		fprintf(stderr, "Error: unknown tokenizer '%s' (use estimate or words)\n", tokenizer_name.c_str());
		return 1;
	}

	try {
		StorySession session(config, tokenizer);
		session.memory().set_warning_callback([](const std::string& warning) {
			fprintf(stderr, "Notice: %s\n", warning.c_str());
		});

		session.load_story(story_path);

		if (json_output) {
			std::cout << session.memory().to_json().dump(2) << std::endl;
		} else {
			print_context(session);
		}
	} catch (const StoryError& e) {
		fprintf(stderr, "Error: %s\n", e.what());
		return 1;
	} catch (const HistoryStoreError& e) {
		fprintf(stderr, "Error: %s\n", e.what());
		return 1;
	}

	return 0;
}
