#include "Graduation.hpp"
#include <algorithm>
#include <random>
#include <spdlog/spdlog.h>

SiblingShuffler uniformShuffler() {
    std::random_device rd;
    std::mt19937_64 eng(rd());
    return [eng](std::vector<Card*>& v) mutable {
        std::shuffle(v.begin(), v.end(), eng);
    };
}

GraduationManager::GraduationManager(const SchedulerParams& p, SiblingShuffler shuffler)
    : params(p),
    shuffle(std::move(shuffler))
{
    if (!shuffle) shuffle = uniformShuffler();
}

std::vector<Card*> GraduationManager::siblings(const std::string& group, const std::string& selfId,
    CardStore& store, const DrillMetaTable& meta) {
    std::vector<Card*> out;
    if (group.empty()) return out;

    for (auto& p : store.all()) {
        if (p.first == selfId) continue;
        const DrillMeta* m = meta.find(p.first);
        if (m && m->pattern_group && *m->pattern_group == group) {
            out.push_back(&p.second);
        }
    }
    return out;
}

bool GraduationManager::eligible(const Card& card) const {
    return card.consecutive_correct >= params.graduation_consecutive &&
        card.scheduled_days >= params.graduation_min_interval;
}

/* -------------------------
   Graduation
   -------------------------
   Canonical cards never retire without a replacement: a graduated
   sibling is swapped in first. Non-canonical cards retire only while
   another active member of the group remains.
*/
GraduationResult GraduationManager::checkGraduation(Card& card, Grade grade, CardStore& store,
    DrillMetaTable& meta, std::time_t now) const {
    if (grade < Grade::GOOD) return GraduationResult::NONE;
    if (card.graduated) return GraduationResult::NONE;

    const DrillMeta* m = meta.find(card.id);
    if (!m) return GraduationResult::NONE;
    if (!eligible(card)) return GraduationResult::NONE;

    std::string group = m->pattern_group.value_or("");
    std::vector<Card*> sibs = siblings(group, card.id, store, meta);

    std::vector<Card*> graduatedSibs;
    std::vector<Card*> activeSibs;
    for (Card* s : sibs) {
        (s->graduated ? graduatedSibs : activeSibs).push_back(s);
    }

    if (m->is_canonical) {
        if (graduatedSibs.empty()) {
            spdlog::debug("Canonical {} eligible but has no graduated sibling in '{}'; retained", card.id, group);
            return GraduationResult::RETAINED;
        }

        shuffle(graduatedSibs);
        Card* next = graduatedSibs.front();

        card.graduated = true;
        card.graduation_date = now;
        meta.setCanonical(card.id, false);

        next->graduated = false;
        next->consecutive_correct = 0;
        next->state = CardState::REVIEW;
        next->due = now;
        meta.setCanonical(next->id, true);

        spdlog::info("Canonical swap: {} -> {} in pattern group '{}'", card.id, next->id, group);
        return GraduationResult::SWAPPED;
    }

    if (activeSibs.empty()) {
        spdlog::debug("Card {} eligible but is the last active member of '{}'", card.id, group);
        return GraduationResult::BLOCKED;
    }

    card.graduated = true;
    card.graduation_date = now;
    spdlog::info("Graduated: {} from pattern group '{}'", card.id, group);
    return GraduationResult::GRADUATED;
}

/* -------------------------
   Reactivation
   -------------------------
   A canonical card with repeated recent errors signals that the whole
   pattern is fading, so some retired variants come back.
*/
std::size_t GraduationManager::checkReactivation(Card& card, CardStore& store,
    const DrillMetaTable& meta, std::time_t now) const {
    const DrillMeta* m = meta.find(card.id);
    if (!m || !m->is_canonical || !m->pattern_group) return 0;

    std::time_t windowStart = now - static_cast<std::time_t>(params.reactivation_window_days) * 24 * 60 * 60;
    int recent = card.errorsSince(windowStart);
    if (recent < params.reactivation_lapse_threshold) return 0;

    std::vector<Card*> graduatedSibs;
    for (Card* s : siblings(*m->pattern_group, card.id, store, meta)) {
        if (s->graduated) graduatedSibs.push_back(s);
    }
    if (graduatedSibs.empty()) return 0;

    shuffle(graduatedSibs);
    std::size_t count = std::min(params.reactivation_max_siblings, graduatedSibs.size());

    for (std::size_t i = 0; i < count; ++i) {
        Card* s = graduatedSibs[i];
        s->graduated = false;
        s->state = CardState::RELEARNING;
        s->consecutive_correct = 0;
        s->learning_step = 0;
        s->due = now;
        spdlog::info("Reactivated: {} after {} recent errors on canonical {}", s->id, recent, card.id);
    }
    return count;
}
