#include <gtest/gtest.h>
#include "core/SessionQueue.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

Card& addCard(CardStore& store, const std::string& id, const std::string& pattern, double commonality = 0.5) {
    store.ensure(item(id, pattern, commonality), T0);
    return *store.find(id);
}

Card& addReview(CardStore& store, const std::string& id, const std::string& pattern, std::time_t due) {
    Card& c = addCard(store, id, pattern);
    c.state = CardState::REVIEW;
    c.stability = 5.0;
    c.difficulty = 5.0;
    c.due = due;
    return c;
}

std::vector<std::string> ids(const std::deque<Card*>& q) {
    std::vector<std::string> out;
    for (const Card* c : q) out.push_back(c->id);
    return out;
}

TEST(SessionQueueTest, NewCardsByCommonalityThenReviewsByDue) {
    CardStore store;
    addReview(store, "a-review", "P1", T0 - DAY);
    addCard(store, "b-rare", "P2", 0.3);
    addCard(store, "c-common", "P3", 0.8);

    SessionQueue queue;
    queue.build(store, T0);

    EXPECT_EQ(ids(queue.cards()), (std::vector<std::string>{ "c-common", "b-rare", "a-review" }));
}

TEST(SessionQueueTest, ReviewsOrderedByDueDate) {
    CardStore store;
    addReview(store, "late", "P", T0 - DAY);
    addReview(store, "oldest", "P", T0 - 5 * DAY);
    addReview(store, "recent", "P", T0 - MINUTE);

    SessionQueue queue;
    queue.build(store, T0);
    EXPECT_EQ(ids(queue.cards()), (std::vector<std::string>{ "oldest", "late", "recent" }));
}

TEST(SessionQueueTest, SkipsGraduatedAndNotYetDue) {
    CardStore store;
    addReview(store, "future", "P", T0 + DAY);
    addReview(store, "due", "P", T0);
    addCard(store, "retired", "P").graduated = true;
    Card& fresh = addCard(store, "fresh", "P");
    fresh.due = T0 + 10 * DAY; // New cards ignore the due date

    auto due = SessionQueue::dueCards(store, T0);
    std::vector<std::string> names;
    for (const Card* c : due) names.push_back(c->id);

    EXPECT_EQ(names, (std::vector<std::string>{ "due", "fresh" }));
}

TEST(SessionQueueTest, TruncatesToCap) {
    CardStore store;
    for (int i = 0; i < 30; ++i) {
        addCard(store, "card" + std::to_string(100 + i), "P", i / 100.0);
    }

    SessionQueue queue;
    EXPECT_EQ(queue.build(store, T0).size(), 20u);
    EXPECT_EQ(queue.cards().front()->id, "card129");

    EXPECT_EQ(queue.build(store, T0, 5).size(), 5u);
}

TEST(SessionQueueTest, NextAvoidsLastPattern) {
    CardStore store;
    addCard(store, "a", "P1", 0.9);
    addCard(store, "b", "P1", 0.8);
    addCard(store, "c", "P2", 0.7);

    SessionQueue queue;
    queue.build(store, T0);
    queue.notePattern("P1");

    Card* next = queue.next(store, T0);
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->id, "c");
    EXPECT_EQ(ids(queue.cards()), (std::vector<std::string>{ "a", "b" }));
}

TEST(SessionQueueTest, NextKeepsFrontWhenAllShareThePattern) {
    CardStore store;
    addCard(store, "a", "P1", 0.9);
    addCard(store, "b", "P1", 0.8);

    SessionQueue queue;
    queue.build(store, T0);
    queue.notePattern("P1");

    EXPECT_EQ(queue.next(store, T0)->id, "a");
}

TEST(SessionQueueTest, RotationMovesOnlyOneCard) {
    CardStore store;
    addCard(store, "a", "P1", 0.9);
    addCard(store, "b", "P2", 0.8);
    addCard(store, "c", "P1", 0.7);
    addCard(store, "d", "P3", 0.6);

    SessionQueue queue;
    queue.build(store, T0);
    queue.notePattern("P2");

    EXPECT_EQ(queue.next(store, T0)->id, "a");
    EXPECT_EQ(ids(queue.cards()), (std::vector<std::string>{ "b", "c", "d" }));
}

TEST(SessionQueueTest, EmptyPatternDisablesRotation) {
    CardStore store;
    addCard(store, "a", "", 0.9);
    addCard(store, "b", "P", 0.8);

    SessionQueue queue;
    queue.build(store, T0);
    queue.notePattern("");
    EXPECT_EQ(queue.next(store, T0)->id, "a");
}

TEST(SessionQueueTest, NextRebuildsWhenEmptyAndReportsNothingDue) {
    CardStore store;
    SessionQueue queue;
    EXPECT_EQ(queue.next(store, T0), nullptr);

    addReview(store, "r", "P", T0 - DAY);
    Card* next = queue.next(store, T0);
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->id, "r");
    EXPECT_TRUE(queue.empty());
}

} // namespace
