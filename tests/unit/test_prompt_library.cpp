#include <gtest/gtest.h>
#include "prompt_library.h"
#include "system_prompt.h"
#include "test_helpers.h"
#include "temp_dir.h"

class PromptLibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = std::make_unique<test_helpers::TempDir>("prompts_test_");
        ASSERT_TRUE(temp_dir->valid());
        path = temp_dir->file_path("system_prompts.json");
    }

    std::unique_ptr<test_helpers::TempDir> temp_dir;
    std::string path;
};

// =============================================================================
// Load / save
// =============================================================================

TEST_F(PromptLibraryTest, MissingFileCreatesDefault) {
    PromptLibrary library(path);
    library.load();

    EXPECT_EQ(library.get_prompt_names(), std::vector<std::string>{PromptLibrary::DEFAULT_PROMPT_NAME});
    EXPECT_EQ(library.get_active_prompt_name(), PromptLibrary::DEFAULT_PROMPT_NAME);
    EXPECT_EQ(library.get_active_prompt_content(), SYSTEM_PROMPT);

    nlohmann::json written = nlohmann::json::parse(test_helpers::read_file(path));
    EXPECT_EQ(written["active_prompt"], PromptLibrary::DEFAULT_PROMPT_NAME);
    EXPECT_TRUE(written["prompts"][PromptLibrary::DEFAULT_PROMPT_NAME]["created_at"].is_string());
}

TEST_F(PromptLibraryTest, LoadExistingFile) {
    ASSERT_TRUE(test_helpers::write_file(path, R"({
        "active_prompt": "Noir",
        "prompts": {
            "Noir": {"content": "Write hardboiled prose.", "created_at": "2024-01-01T10:00:00", "last_used": "2024-01-02T10:00:00"},
            "Broken": {"text": "no content key"},
            "Plain": {"content": "Plain style."}
        }
    })"));

    PromptLibrary library(path);
    library.load();

    EXPECT_EQ(library.get_prompt_names(), (std::vector<std::string>{"Noir", "Plain"}));
    EXPECT_EQ(library.get_active_prompt_name(), "Noir");
    EXPECT_EQ(library.get_active_prompt_content(), "Write hardboiled prose.");

    auto entry = library.get_prompt("Noir");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->created_at, "2024-01-01T10:00:00");
    EXPECT_FALSE(library.get_prompt("Broken").has_value());
}

TEST_F(PromptLibraryTest, InvalidJsonResetsToDefault) {
    ASSERT_TRUE(test_helpers::write_file(path, "{ broken"));
    PromptLibrary library(path);
    library.load();

    EXPECT_EQ(library.get_active_prompt_name(), PromptLibrary::DEFAULT_PROMPT_NAME);
    EXPECT_NO_THROW(nlohmann::json::parse(test_helpers::read_file(path)));
}

TEST_F(PromptLibraryTest, InvalidStructureResetsToDefault) {
    ASSERT_TRUE(test_helpers::write_file(path, R"({"prompts": []})"));
    PromptLibrary library(path);
    library.load();

    EXPECT_EQ(library.get_prompt_names().size(), 1u);
    EXPECT_EQ(library.get_active_prompt_content(), SYSTEM_PROMPT);
}

TEST_F(PromptLibraryTest, ChangesPersistAcrossInstances) {
    {
        PromptLibrary library(path);
        library.load();
        ASSERT_TRUE(library.save_prompt("Gothic", "Dark and ornate."));
        ASSERT_TRUE(library.set_active_prompt("Gothic"));
    }

    PromptLibrary reloaded(path);
    reloaded.load();
    EXPECT_EQ(reloaded.get_active_prompt_name(), "Gothic");
    EXPECT_EQ(reloaded.get_active_prompt_content(), "Dark and ornate.");
}

TEST_F(PromptLibraryTest, SaveFailureThrows) {
    ASSERT_TRUE(test_helpers::write_file(temp_dir->file_path("blocker"), "x"));
    PromptLibrary library(temp_dir->file_path("blocker/system_prompts.json"));

    EXPECT_THROW(library.save(), PromptLibraryError);
    EXPECT_THROW(library.save_prompt("New", "text"), PromptLibraryError);
}

TEST_F(PromptLibraryTest, DefaultPathFollowsConfigDirectory) {
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", temp_dir->path());
    EXPECT_EQ(PromptLibrary::get_default_path(), temp_dir->path() + "/inkwell/system_prompts.json");
}

// =============================================================================
// Editing
// =============================================================================

TEST_F(PromptLibraryTest, SavePromptUpdatesExisting) {
    PromptLibrary library(path);
    library.load();
    library.save_prompt("Terse", "Short sentences.");
    library.save_prompt("Terse", "Shorter.");

    EXPECT_EQ(library.get_prompt("Terse")->content, "Shorter.");
    EXPECT_EQ(library.get_prompt_names().size(), 2u);
    EXPECT_FALSE(library.save_prompt("", "nameless"));
}

TEST_F(PromptLibraryTest, SetActiveUnknownFails) {
    PromptLibrary library(path);
    library.load();
    EXPECT_FALSE(library.set_active_prompt("Missing"));
    EXPECT_EQ(library.get_active_prompt_name(), PromptLibrary::DEFAULT_PROMPT_NAME);
}

TEST_F(PromptLibraryTest, DeleteActiveFallsBackToDefault) {
    PromptLibrary library(path);
    library.load();
    library.save_prompt("Temp", "Temporary.");
    library.set_active_prompt("Temp");

    EXPECT_TRUE(library.delete_prompt("Temp"));
    EXPECT_EQ(library.get_active_prompt_name(), PromptLibrary::DEFAULT_PROMPT_NAME);
    EXPECT_FALSE(library.get_prompt("Temp").has_value());
    EXPECT_FALSE(library.delete_prompt("Temp"));
}

TEST_F(PromptLibraryTest, DefaultCannotBeDeleted) {
    PromptLibrary library(path);
    library.load();
    EXPECT_FALSE(library.delete_prompt(PromptLibrary::DEFAULT_PROMPT_NAME));
    EXPECT_TRUE(library.get_prompt(PromptLibrary::DEFAULT_PROMPT_NAME).has_value());
}

TEST_F(PromptLibraryTest, DanglingActiveNameFallsBack) {
    ASSERT_TRUE(test_helpers::write_file(path, R"({
        "active_prompt": "Gone",
        "prompts": {"Kept": {"content": "Still here."}}
    })"));
    PromptLibrary library(path);
    library.load();

    EXPECT_EQ(library.get_active_prompt_name(), PromptLibrary::DEFAULT_PROMPT_NAME);
    // Default entry itself is absent from this file, so the built-in text is used
    EXPECT_EQ(library.get_active_prompt_content(), SYSTEM_PROMPT);
}

// =============================================================================
// Command handler
// =============================================================================

TEST_F(PromptLibraryTest, PromptArgsListMarksActive) {
    PromptLibrary library(path);
    library.load();
    library.save_prompt("Alt", "Alternative.");

    std::string output;
    EXPECT_EQ(handle_prompt_args(library, {"list"}, [&output](const std::string& s) { output += s; }), 0);
    EXPECT_NE(output.find("  Alt\n"), std::string::npos);
    EXPECT_NE(output.find(std::string("* ") + PromptLibrary::DEFAULT_PROMPT_NAME), std::string::npos);
}

TEST_F(PromptLibraryTest, PromptArgsSetUseShowDelete) {
    PromptLibrary library(path);
    library.load();
    std::string output;
    auto collect = [&output](const std::string& s) { output += s; };

    EXPECT_EQ(handle_prompt_args(library, {"set", "Epic", "Grand and sweeping."}, collect), 0);
    EXPECT_EQ(handle_prompt_args(library, {"use", "Epic"}, collect), 0);
    EXPECT_EQ(library.get_active_prompt_name(), "Epic");

    output.clear();
    EXPECT_EQ(handle_prompt_args(library, {"show"}, collect), 0);
    EXPECT_NE(output.find("Grand and sweeping."), std::string::npos);

    EXPECT_EQ(handle_prompt_args(library, {"delete", "Epic"}, collect), 0);
    EXPECT_EQ(handle_prompt_args(library, {"use", "Epic"}, collect), 1);
    EXPECT_EQ(handle_prompt_args(library, {"show", "Epic"}, collect), 1);
    EXPECT_EQ(handle_prompt_args(library, {"rename"}, collect), 1);
}
