#pragma once
#include <ctime>
#include <functional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "CardStore.hpp"
#include "DrillMeta.hpp"
#include "SchedulerParams.hpp"

// Reorders the candidates in place; callers take from the front.
using SiblingShuffler = std::function<void(std::vector<Card*>&)>;

// Uniform Fisher-Yates shuffle over a privately seeded engine.
SiblingShuffler uniformShuffler();

enum class GraduationResult {
    NONE,       // not eligible
    RETAINED,   // eligible canonical kept: no graduated sibling to swap in
    SWAPPED,    // canonical retired, a graduated sibling took over
    GRADUATED,  // non-canonical variant retired
    BLOCKED     // eligible non-canonical kept: last active member of its group
};

/*
  Pattern-group rotation:
   - mastered variants retire from active review
   - every pattern group keeps one canonical card in rotation
   - repeated canonical failures bring retired variants back
*/
class GraduationManager {
public:
    GraduationManager(const SchedulerParams& params, SiblingShuffler shuffler);

    // Run after a grade has been applied to `card`.
    GraduationResult checkGraduation(Card& card, Grade grade, CardStore& store,
        DrillMetaTable& meta, std::time_t now) const;

    // Run after an AGAIN grade. Returns the number of reactivated siblings.
    std::size_t checkReactivation(Card& card, CardStore& store,
        const DrillMetaTable& meta, std::time_t now) const;

    // Cards sharing `group`, excluding `selfId`.
    static std::vector<Card*> siblings(const std::string& group, const std::string& selfId,
        CardStore& store, const DrillMetaTable& meta);

private:
    const SchedulerParams& params;
    SiblingShuffler shuffle;

    bool eligible(const Card& card) const;
};
