#include "StudySession.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
constexpr double MASTERED_STABILITY = 21.0;

Clock systemClock() {
    return []() { return std::time(nullptr); };
}
}

StudySession::StudySession(const SchedulerParams& p, std::shared_ptr<KeyValueStore> kv, SessionOptions options)
    : params(p),
    sessionQueue(options.max_cards),
    scheduler(params),
    graduation(params, std::move(options.shuffler)),
    persister(std::move(kv), options.async_persist),
    clock(options.clock ? std::move(options.clock) : systemClock()),
    storageKey(options.storage_key)
{
    spdlog::info("Study session created: key='{}', queue cap {}", storageKey, sessionQueue.maxCards());
}

bool StudySession::load() {
    sessionQueue.clear();

    auto blob = persister.load(storageKey);
    bool ok = true;
    if (!blob) {
        spdlog::warn("No saved cards under '{}'; starting empty", storageKey);
        store.clear();
    }
    else if (!store.deserialize(*blob)) {
        spdlog::error("Saved cards under '{}' are unreadable; starting empty", storageKey);
        store.clear();
        ok = false;
    }

    savedCanonical = persister.load(metaKey());
    if (savedCanonical && !meta.empty()) {
        meta.applyCanonical(*savedCanonical);
    }
    return ok;
}

void StudySession::save() {
    persister.beginRound();
    persister.save(storageKey, store.serialize());
    if (!meta.empty()) {
        persister.save(metaKey(), meta.serializeCanonical());
    }
}

void StudySession::initializeCards(const std::vector<DrillItem>& items) {
    std::time_t now = clock();
    std::size_t created = 0;
    for (const auto& item : items) {
        if (store.ensure(item, now)) ++created;
    }
    spdlog::info("initializeCards: {} new card(s), {} total", created, store.size());
    save();
}

void StudySession::loadDrillMeta(const std::vector<DrillMetaRecord>& records) {
    meta.load(records);
    if (savedCanonical) {
        meta.applyCanonical(*savedCanonical);
    }
}

std::optional<ReviewResult> StudySession::processReview(const std::string& cardId, Grade grade,
    const ErrorInfo* error) {
    Card* c = store.find(cardId);
    if (!c) {
        spdlog::warn("processReview: unknown card '{}'", cardId);
        return std::nullopt;
    }

    std::time_t now = clock();
    ReviewOutcome out = scheduler.review(*c, grade, now, error);

    sessionQueue.notePattern(c->pos_pattern);

    sessionStats.reviewed++;
    if (grade >= Grade::GOOD) sessionStats.correct++;
    else sessionStats.incorrect++;

    ReviewResult result;
    result.graduation = graduation.checkGraduation(*c, grade, store, meta, now);
    if (grade == Grade::AGAIN) {
        result.reactivated = graduation.checkReactivation(*c, store, meta, now);
    }

    save();

    result.card = *c;
    result.interval = out.intervalInDays();
    result.next_due = out.next_due;
    result.interval_display = out.intervalDisplay();
    return result;
}

const std::deque<Card*>& StudySession::buildSessionQueue() {
    return sessionQueue.build(store, clock());
}

const std::deque<Card*>& StudySession::buildSessionQueue(std::size_t maxCards) {
    return sessionQueue.build(store, clock(), maxCards);
}

Card* StudySession::getNextCard() {
    return sessionQueue.next(store, clock());
}

std::vector<Card*> StudySession::getDueCards() {
    return SessionQueue::dueCards(store, clock());
}

CardStats StudySession::getStats() const {
    CardStats stats;
    std::time_t now = clock();
    double totalStability = 0.0;
    double totalDifficulty = 0.0;
    std::size_t reviewedCount = 0;

    for (const auto& p : store.all()) {
        const Card& c = p.second;
        ++stats.total;
        switch (c.state) {
        case CardState::NEW: ++stats.new_cards; break;
        case CardState::LEARNING: ++stats.learning; break;
        case CardState::REVIEW: ++stats.review; break;
        case CardState::RELEARNING: ++stats.relearning; break;
        }

        if (c.isDue(now)) ++stats.due_now;
        if (c.stability > MASTERED_STABILITY) ++stats.mastered;

        if (c.reps > 0) {
            totalStability += c.stability;
            totalDifficulty += c.difficulty;
            ++reviewedCount;
        }

        stats.total_reviews += c.reps;
        stats.total_lapses += c.lapses;
    }

    if (reviewedCount > 0) {
        stats.avg_stability = totalStability / reviewedCount;
        stats.avg_difficulty = totalDifficulty / reviewedCount;
    }
    stats.session = sessionStats;
    return stats;
}

GraduationStats StudySession::getGraduationStats() const {
    GraduationStats g;
    g.total = store.size();
    for (const auto& p : store.all()) {
        if (p.second.graduated) ++g.graduated;
    }
    g.active = g.total - g.graduated;
    g.patterns = meta.patternGroupCount();
    if (g.total > 0) {
        g.percent_graduated = std::round(1000.0 * g.graduated / g.total) / 10.0;
    }
    return g;
}

std::map<std::string, std::vector<const Card*>> StudySession::getPatternGroups() const {
    std::map<std::string, std::vector<const Card*>> groups;
    for (const auto& p : store.all()) {
        const Card& c = p.second;
        groups[c.pos_pattern.empty() ? "unknown" : c.pos_pattern].push_back(&c);
    }
    return groups;
}

std::vector<const Card*> StudySession::getProblematicCards(std::size_t limit) const {
    std::vector<const Card*> out;
    for (const auto& p : store.all()) {
        if (!p.second.error_history.empty()) out.push_back(&p.second);
    }

    std::stable_sort(out.begin(), out.end(),
        [](const Card* a, const Card* b) {
            return a->error_history.size() > b->error_history.size();
        });

    if (out.size() > limit) out.resize(limit);
    return out;
}

std::map<std::string, int> StudySession::getErrorDistribution() const {
    std::map<std::string, int> dist;
    for (const auto& p : store.all()) {
        for (const auto& e : p.second.error_history) {
            dist[e.type]++;
        }
    }
    return dist;
}

bool StudySession::resetCard(const std::string& cardId) {
    Card* c = store.find(cardId);
    if (!c) {
        spdlog::warn("resetCard: unknown card '{}'", cardId);
        return false;
    }
    c->reset(clock());
    save();
    return true;
}

void StudySession::resetAllCards() {
    std::time_t now = clock();
    for (auto& p : store.all()) {
        p.second.reset(now);
    }
    sessionQueue.clear();
    spdlog::info("All {} cards reset", store.size());
    save();
}
