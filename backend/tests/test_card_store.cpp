#include <gtest/gtest.h>
#include "core/CardStore.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

TEST(CardStoreTest, EnsureCreatesOnce) {
    CardStore store;
    EXPECT_TRUE(store.ensure(item("a", "P"), T0));
    store.find("a")->reps = 4;

    EXPECT_FALSE(store.ensure(item("a", "Q"), T0 + DAY));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find("a")->reps, 4);
    EXPECT_EQ(store.find("a")->pos_pattern, "P");
}

TEST(CardStoreTest, EnsureRejectsEmptyId) {
    CardStore store;
    EXPECT_FALSE(store.ensure(item(""), T0));
    EXPECT_EQ(store.size(), 0u);
}

TEST(CardStoreTest, LookupOfMissingCard) {
    CardStore store;
    EXPECT_EQ(store.find("nope"), nullptr);
    EXPECT_FALSE(store.contains("nope"));
}

TEST(CardStoreTest, SerializedCardsComeBackUnchanged) {
    CardStore store;
    store.ensure(item("verb-1", "PRON VERB ADV", 0.35, 2), T0);
    store.ensure(item("noun-1", "", 0.9, 1), T0);

    Card& c = *store.find("verb-1");
    c.state = CardState::RELEARNING;
    c.stability = 2.874332436209693;
    c.difficulty = 6.1234;
    c.elapsed_days = 10.25;
    c.scheduled_days = 1.0 / 1440.0;
    c.reps = 7;
    c.lapses = 2;
    c.last_review = T0 - DAY;
    c.learning_step = 1;
    c.graduated = true;
    c.graduation_date = T0 - 3 * DAY;
    c.consecutive_correct = 0;
    c.recordError("word order", T0 - 2 * DAY, 10);
    c.recordError("spelling", T0 - DAY, 10);

    CardStore copy;
    ASSERT_TRUE(copy.deserialize(store.serialize()));
    ASSERT_EQ(copy.size(), 2u);

    const Card& r = *copy.find("verb-1");
    EXPECT_EQ(r.state, CardState::RELEARNING);
    EXPECT_EQ(r.stability, c.stability);
    EXPECT_EQ(r.difficulty, c.difficulty);
    EXPECT_EQ(r.elapsed_days, c.elapsed_days);
    EXPECT_EQ(r.scheduled_days, c.scheduled_days);
    EXPECT_EQ(r.reps, 7);
    EXPECT_EQ(r.lapses, 2);
    EXPECT_EQ(r.last_review, T0 - DAY);
    EXPECT_EQ(r.learning_step, 1);
    EXPECT_EQ(r.pos_pattern, "PRON VERB ADV");
    EXPECT_EQ(r.commonality, 0.35);
    EXPECT_EQ(r.unit, 2);
    EXPECT_TRUE(r.graduated);
    EXPECT_EQ(r.graduation_date, T0 - 3 * DAY);
    ASSERT_EQ(r.error_history.size(), 2u);
    EXPECT_EQ(r.error_history[0].type, "word order");
    EXPECT_EQ(r.error_history[0].timestamp, T0 - 2 * DAY);

    EXPECT_EQ(copy.find("noun-1")->pos_pattern, "");
    EXPECT_EQ(copy.find("noun-1")->state, CardState::NEW);
}

TEST(CardStoreTest, UnknownHeaderIsRejected) {
    CardStore store;
    store.ensure(item("keep"), T0);

    EXPECT_FALSE(store.deserialize("SOMETHING ELSE\nabc\n"));
    EXPECT_FALSE(store.deserialize(""));
    EXPECT_TRUE(store.contains("keep"));
}

TEST(CardStoreTest, MalformedBlocksAreSkipped) {
    CardStore good;
    good.ensure(item("a", "P"), T0);
    good.ensure(item("c", "P"), T0);
    std::string blob = good.serialize();

    // Splice a broken block between the two valid ones.
    std::string broken = "b\nnot numbers at all\nP\n0.5 1\n0 0 0\n0\n---\n";
    auto pos = blob.find("c\n");
    ASSERT_NE(pos, std::string::npos);
    blob.insert(pos, broken);

    CardStore store;
    ASSERT_TRUE(store.deserialize(blob));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains("a"));
    EXPECT_FALSE(store.contains("b"));
    EXPECT_TRUE(store.contains("c"));
}

TEST(CardStoreTest, OutOfRangeStateIsMalformed) {
    std::string blob =
        "RETAIN-CARDS 1\n"
        "x\n"
        "1700000000 0 0 0 0 0 0 9 0 0\n"
        "P\n"
        "0.5 1\n"
        "0 0 0\n"
        "0\n"
        "---\n";
    CardStore store;
    ASSERT_TRUE(store.deserialize(blob));
    EXPECT_EQ(store.size(), 0u);
}

TEST(CardStoreTest, UnterminatedTrailingBlockIsDropped) {
    CardStore good;
    good.ensure(item("a"), T0);
    std::string blob = good.serialize() + "b\n1700000000 0 0";

    CardStore store;
    ASSERT_TRUE(store.deserialize(blob));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.contains("a"));
}

} // namespace
