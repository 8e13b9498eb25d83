#include <gtest/gtest.h>
#include "history_simulator.h"
#include "test_helpers.h"

namespace {

std::vector<std::string> numbered_chunks(size_t count) {
    std::vector<std::string> chunks;
    for (size_t i = 1; i <= count; i++) {
        chunks.push_back("C" + std::to_string(i));
    }
    return chunks;
}

} // namespace

// =============================================================================
// simulate
// =============================================================================

TEST(HistorySimulatorTest, LastChunksAsPairsInOrder) {
    HistorySimulator simulator;
    auto messages = simulator.simulate(numbered_chunks(7), 5);

    ASSERT_EQ(messages.size(), 10u);
    for (size_t i = 0; i < 5; i++) {
        const Message& prompt = messages[i * 2];
        const Message& chunk = messages[i * 2 + 1];
        EXPECT_TRUE(prompt.is_user());
        EXPECT_EQ(prompt.content(), HistorySimulator::DEFAULT_PROMPT);
        EXPECT_TRUE(chunk.is_assistant());
        EXPECT_EQ(chunk.content(), "C" + std::to_string(i + 3));
    }
}

TEST(HistorySimulatorTest, FewerChunksThanLimit) {
    HistorySimulator simulator;
    auto messages = simulator.simulate(numbered_chunks(2), 5);

    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[1].content(), "C1");
    EXPECT_EQ(messages[3].content(), "C2");
}

TEST(HistorySimulatorTest, ZeroLimitOrNoChunks) {
    HistorySimulator simulator;
    EXPECT_TRUE(simulator.simulate(numbered_chunks(3), 0).empty());
    EXPECT_TRUE(simulator.simulate({}, 5).empty());
}

TEST(HistorySimulatorTest, CustomPrompt) {
    HistorySimulator simulator("[next]");
    auto messages = simulator.simulate({"only"}, 5);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].content(), "[next]");
    EXPECT_EQ(simulator.get_simulated_prompt(), "[next]");
}

// =============================================================================
// build / seed
// =============================================================================

TEST(HistorySimulatorTest, BuildProducesCleanStore) {
    HistorySimulator simulator;
    auto store = simulator.build(numbered_chunks(7), 5, 1000, test_helpers::byte_tokenizer());

    EXPECT_FALSE(store->has_pending_proposal());
    EXPECT_EQ(store->get_message_count(), 10u);
    EXPECT_EQ(store->committed_messages().back().content(), "C7");
}

TEST(HistorySimulatorTest, BuildTruncatesToBudget) {
    // Each pair is "(continue)" (10) + "Cn" (2) = 12 tokens
    HistorySimulator simulator;
    auto store = simulator.build(numbered_chunks(7), 5, 25, test_helpers::byte_tokenizer());

    auto messages = store->active_messages();
    EXPECT_LE(store->get_token_count(), 25);
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[1].content(), "C6");
    EXPECT_EQ(messages[3].content(), "C7");
}

TEST(HistorySimulatorTest, SeedReplacesExistingHistory) {
    HistoryStore store(test_helpers::byte_tokenizer(), 1000);
    store.reset({Message(Message::USER, "old")});
    store.add_message(Message(Message::ASSISTANT, "pending"));

    HistorySimulator simulator;
    simulator.seed(store, {"a", "b"}, 5);

    EXPECT_FALSE(store.has_pending_proposal());
    auto messages = store.active_messages();
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[3].content(), "b");
}

// =============================================================================
// Canon text splitting
// =============================================================================

TEST(HistorySimulatorTest, SplitOnBlankLines) {
    auto chunks = split_canon_text("First part.\nStill first.\n\nSecond part.\n\n\n\n  Third.  \n");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], "First part.\nStill first.");
    EXPECT_EQ(chunks[1], "Second part.");
    EXPECT_EQ(chunks[2], "Third.");
}

TEST(HistorySimulatorTest, SplitNormalizesCrlf) {
    auto chunks = split_canon_text("One\r\n\r\nTwo\r\n");

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "One");
    EXPECT_EQ(chunks[1], "Two");
}

TEST(HistorySimulatorTest, SplitEmptyText) {
    EXPECT_TRUE(split_canon_text("").empty());
    EXPECT_TRUE(split_canon_text("\n\n  \n\n").empty());
}

TEST(HistorySimulatorTest, JoinWithBlankLines) {
    EXPECT_EQ(join_canon_text({"a", "b", "c"}), "a\n\nb\n\nc");
    EXPECT_EQ(join_canon_text({}), "");
    EXPECT_EQ(split_canon_text(join_canon_text({"x", "y"})), (std::vector<std::string>{"x", "y"}));
}
