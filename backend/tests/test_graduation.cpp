#include <gtest/gtest.h>
#include "core/Graduation.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

class GraduationTest : public ::testing::Test {
protected:
    SchedulerParams params;
    CardStore store;
    DrillMetaTable meta;

    void SetUp() override {
        for (const char* id : { "g1-a", "g1-b", "g1-c", "g1-d", "g1-e", "solo" }) {
            store.ensure(item(id, "PAT"), T0);
        }
        meta.load({
            metaRecord("g1-a", "g1", true),
            metaRecord("g1-b", "g1", false),
            metaRecord("g1-c", "g1", false),
            metaRecord("g1-d", "g1", false),
            metaRecord("g1-e", "g1", false),
        });
    }

    Card& card(const std::string& id) { return *store.find(id); }

    Card& mastered(const std::string& id) {
        Card& c = card(id);
        c.state = CardState::REVIEW;
        c.consecutive_correct = 5;
        c.scheduled_days = 20.0;
        return c;
    }

    std::size_t activeInGroup() {
        std::size_t n = 0;
        for (const char* id : { "g1-a", "g1-b", "g1-c", "g1-d", "g1-e" }) {
            if (!card(id).graduated) ++n;
        }
        return n;
    }
};

TEST_F(GraduationTest, SiblingsShareGroupAndExcludeSelf) {
    auto sibs = GraduationManager::siblings("g1", "g1-a", store, meta);
    ASSERT_EQ(sibs.size(), 4u);
    for (const Card* c : sibs) EXPECT_NE(c->id, "g1-a");

    EXPECT_TRUE(GraduationManager::siblings("", "solo", store, meta).empty());
}

TEST_F(GraduationTest, NonCanonicalGraduatesWhileGroupStaysActive) {
    GraduationManager grad(params, firstShuffler());
    Card& b = mastered("g1-b");

    EXPECT_EQ(grad.checkGraduation(b, Grade::GOOD, store, meta, T0), GraduationResult::GRADUATED);
    EXPECT_TRUE(b.graduated);
    EXPECT_EQ(b.graduation_date, T0);
    EXPECT_FALSE(meta.isCanonical("g1-b"));
}

TEST_F(GraduationTest, LastActiveNonCanonicalIsKept) {
    GraduationManager grad(params, firstShuffler());
    for (const char* id : { "g1-a", "g1-c", "g1-d", "g1-e" }) card(id).graduated = true;
    Card& b = mastered("g1-b");

    EXPECT_EQ(grad.checkGraduation(b, Grade::EASY, store, meta, T0), GraduationResult::BLOCKED);
    EXPECT_FALSE(b.graduated);
    EXPECT_EQ(activeInGroup(), 1u);
}

TEST_F(GraduationTest, CanonicalSwapsWithGraduatedSibling) {
    GraduationManager grad(params, firstShuffler());
    Card& c = card("g1-c");
    c.graduated = true;
    c.consecutive_correct = 7;
    c.state = CardState::REVIEW;
    c.due = T0 + 40 * DAY;
    Card& a = mastered("g1-a");

    EXPECT_EQ(grad.checkGraduation(a, Grade::GOOD, store, meta, T0), GraduationResult::SWAPPED);

    EXPECT_TRUE(a.graduated);
    EXPECT_EQ(a.graduation_date, T0);
    EXPECT_FALSE(meta.isCanonical("g1-a"));

    EXPECT_FALSE(c.graduated);
    EXPECT_TRUE(meta.isCanonical("g1-c"));
    EXPECT_EQ(c.consecutive_correct, 0);
    EXPECT_EQ(c.state, CardState::REVIEW);
    EXPECT_EQ(c.due, T0);

    int canonicals = 0;
    for (const char* id : { "g1-a", "g1-b", "g1-c", "g1-d", "g1-e" }) {
        if (meta.isCanonical(id)) ++canonicals;
    }
    EXPECT_EQ(canonicals, 1);
}

TEST_F(GraduationTest, SwapPicksFromShuffledCandidates) {
    GraduationManager grad(params, reverseShuffler());
    card("g1-b").graduated = true;
    card("g1-d").graduated = true;
    Card& a = mastered("g1-a");

    ASSERT_EQ(grad.checkGraduation(a, Grade::GOOD, store, meta, T0), GraduationResult::SWAPPED);
    EXPECT_TRUE(meta.isCanonical("g1-d"));
    EXPECT_FALSE(meta.isCanonical("g1-b"));
    EXPECT_TRUE(card("g1-b").graduated);
}

TEST_F(GraduationTest, CanonicalWithoutGraduatedSiblingIsRetained) {
    GraduationManager grad(params, firstShuffler());
    Card& a = mastered("g1-a");

    EXPECT_EQ(grad.checkGraduation(a, Grade::GOOD, store, meta, T0), GraduationResult::RETAINED);
    EXPECT_FALSE(a.graduated);
    EXPECT_TRUE(meta.isCanonical("g1-a"));
}

TEST_F(GraduationTest, RequiresStreakIntervalAndPassingGrade) {
    GraduationManager grad(params, firstShuffler());
    Card& b = mastered("g1-b");

    b.consecutive_correct = 4;
    EXPECT_EQ(grad.checkGraduation(b, Grade::GOOD, store, meta, T0), GraduationResult::NONE);

    b.consecutive_correct = 5;
    b.scheduled_days = 15.9;
    EXPECT_EQ(grad.checkGraduation(b, Grade::GOOD, store, meta, T0), GraduationResult::NONE);

    b.scheduled_days = 16.0;
    EXPECT_EQ(grad.checkGraduation(b, Grade::HARD, store, meta, T0), GraduationResult::NONE);
    EXPECT_FALSE(b.graduated);
}

TEST_F(GraduationTest, CardsWithoutMetadataNeverGraduate) {
    GraduationManager grad(params, firstShuffler());
    Card& solo = mastered("solo");
    EXPECT_EQ(grad.checkGraduation(solo, Grade::EASY, store, meta, T0), GraduationResult::NONE);
    EXPECT_FALSE(solo.graduated);
}

TEST_F(GraduationTest, CardsWithoutGroupNeverGraduate) {
    meta.load({ metaRecord("solo", "", false) });
    GraduationManager grad(params, firstShuffler());
    Card& solo = mastered("solo");
    EXPECT_EQ(grad.checkGraduation(solo, Grade::GOOD, store, meta, T0), GraduationResult::BLOCKED);
    EXPECT_FALSE(solo.graduated);
}

TEST_F(GraduationTest, ReactivatesUpToThreeSiblings) {
    GraduationManager grad(params, firstShuffler());
    for (const char* id : { "g1-b", "g1-c", "g1-d", "g1-e" }) card(id).graduated = true;

    Card& a = card("g1-a");
    a.recordError("grammar", T0 - 3 * DAY, params.max_error_history);
    a.recordError("word_order", T0, params.max_error_history);

    EXPECT_EQ(grad.checkReactivation(a, store, meta, T0), 3u);

    std::size_t restored = 0;
    for (const char* id : { "g1-b", "g1-c", "g1-d", "g1-e" }) {
        Card& s = card(id);
        if (s.graduated) continue;
        ++restored;
        EXPECT_EQ(s.state, CardState::RELEARNING);
        EXPECT_EQ(s.learning_step, 0);
        EXPECT_EQ(s.consecutive_correct, 0);
        EXPECT_EQ(s.due, T0);
    }
    EXPECT_EQ(restored, 3u);
    EXPECT_TRUE(card("g1-e").graduated);
}

TEST_F(GraduationTest, ReactivationIgnoresOldErrors) {
    GraduationManager grad(params, firstShuffler());
    card("g1-b").graduated = true;

    Card& a = card("g1-a");
    a.recordError("grammar", T0 - 31 * DAY, params.max_error_history);
    a.recordError("grammar", T0 - 40 * DAY, params.max_error_history);
    a.recordError("grammar", T0, params.max_error_history);

    EXPECT_EQ(grad.checkReactivation(a, store, meta, T0), 0u);
    EXPECT_TRUE(card("g1-b").graduated);
}

TEST_F(GraduationTest, OnlyCanonicalFailuresReactivate) {
    GraduationManager grad(params, firstShuffler());
    card("g1-c").graduated = true;

    Card& b = card("g1-b");
    b.recordError("grammar", T0 - DAY, params.max_error_history);
    b.recordError("grammar", T0, params.max_error_history);

    EXPECT_EQ(grad.checkReactivation(b, store, meta, T0), 0u);
    EXPECT_TRUE(card("g1-c").graduated);
}

} // namespace
