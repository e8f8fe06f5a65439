#pragma once
#include <ctime>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "CardStore.hpp"
#include "DrillMeta.hpp"
#include "Graduation.hpp"
#include "Scheduler.hpp"
#include "SchedulerParams.hpp"
#include "SessionQueue.hpp"
#include "../storage/KeyValueStore.hpp"
#include "../storage/Persister.hpp"

using Clock = std::function<std::time_t()>;

struct SessionOptions {
    std::string storage_key = "retain_srs";
    std::size_t max_cards = SessionQueue::DEFAULT_MAX_CARDS;
    bool async_persist = false;
    Clock clock;               // defaults to std::time(nullptr)
    SiblingShuffler shuffler;  // defaults to uniformShuffler()
};

struct SessionStats {
    int reviewed = 0;
    int correct = 0;
    int incorrect = 0;
};

struct CardStats {
    std::size_t total = 0;
    std::size_t new_cards = 0;
    std::size_t learning = 0;
    std::size_t review = 0;
    std::size_t relearning = 0;
    std::size_t due_now = 0;
    std::size_t mastered = 0;   // stability > 21 days
    double avg_stability = 0.0;
    double avg_difficulty = 0.0;
    long total_reviews = 0;
    long total_lapses = 0;
    SessionStats session;
};

struct GraduationStats {
    std::size_t total = 0;
    std::size_t graduated = 0;
    std::size_t active = 0;
    std::size_t patterns = 0;
    double percent_graduated = 0.0; // one decimal
};

struct ReviewResult {
    Card card;                  // snapshot after the review
    double interval = 0.0;      // days, fractional for learning steps
    std::time_t next_due = 0;
    std::string interval_display;
    GraduationResult graduation = GraduationResult::NONE;
    std::size_t reactivated = 0;
};

/*
  One learner's scheduler: owns the cards, the drill metadata, the
  session queue and the last drawn pattern. Not re-entrant; callers
  run one operation at a time.

  Every mutating operation updates memory first and then hands a
  snapshot to the Persister, so a failed save only costs durability.
*/
class StudySession {
public:
    StudySession(const SchedulerParams& params, std::shared_ptr<KeyValueStore> store,
        SessionOptions options = SessionOptions());

    StudySession(const StudySession&) = delete;
    StudySession& operator=(const StudySession&) = delete;

    // Restores cards (and saved canonical flags) from storage.
    bool load();

    void initializeCards(const std::vector<DrillItem>& items);
    void loadDrillMeta(const std::vector<DrillMetaRecord>& records);

    // Empty result for an unknown id.
    std::optional<ReviewResult> processReview(const std::string& cardId, Grade grade,
        const ErrorInfo* error = nullptr);

    const std::deque<Card*>& buildSessionQueue();
    const std::deque<Card*>& buildSessionQueue(std::size_t maxCards);
    Card* getNextCard();
    std::vector<Card*> getDueCards();

    CardStats getStats() const;
    GraduationStats getGraduationStats() const;
    std::map<std::string, std::vector<const Card*>> getPatternGroups() const;
    std::vector<const Card*> getProblematicCards(std::size_t limit = 10) const;
    std::map<std::string, int> getErrorDistribution() const;

    bool resetCard(const std::string& cardId);
    void resetAllCards();
    void resetSessionStats() { sessionStats = SessionStats(); }

    const Card* card(const std::string& cardId) const { return store.find(cardId); }
    const CardStore& cards() const { return store; }
    const DrillMetaTable& drillMeta() const { return meta; }
    const SessionQueue& queue() const { return sessionQueue; }

    // Advisory: some write of the most recent save round did not succeed.
    // Waits for a pending async save.
    bool saveFailed() { return persister.lastSaveFailed(); }
    void flush() { persister.flush(); }

private:
    SchedulerParams params;
    CardStore store;
    DrillMetaTable meta;
    SessionQueue sessionQueue;
    Scheduler scheduler;
    GraduationManager graduation;
    Persister persister;
    Clock clock;
    std::string storageKey;
    std::optional<std::string> savedCanonical;
    SessionStats sessionStats;

    void save();
    std::string metaKey() const { return storageKey + "_meta"; }
};
