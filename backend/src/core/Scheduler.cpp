#include "Scheduler.hpp"
#include <algorithm>
#include <vector>

namespace {
constexpr std::time_t SECONDS_PER_MINUTE = 60;
constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;
constexpr double MINUTES_PER_DAY = 24.0 * 60.0;
}

double ReviewOutcome::intervalInDays() const {
    if (interval_minutes > 0) return interval_minutes / MINUTES_PER_DAY;
    return static_cast<double>(interval_days);
}

std::string ReviewOutcome::intervalDisplay() const {
    if (interval_minutes > 0) return std::to_string(interval_minutes) + "m";
    return std::to_string(interval_days) + "d";
}

Scheduler::Scheduler(const SchedulerParams& p)
    : params(p),
    memory(p)
{
    spdlog::info("Scheduler initialized: retention={:.2f}, {} learning / {} relearning steps",
        params.request_retention, params.learning_steps.size(), params.relearning_steps.size());
}

ReviewOutcome Scheduler::review(Card& card, Grade grade, std::time_t now, const ErrorInfo* error) const {
    std::time_t lastReview = card.last_review != 0 ? card.last_review : now;
    double elapsedDays = static_cast<double>(now - lastReview) / SECONDS_PER_DAY;

    if (error) {
        card.recordError(error->type, now, params.max_error_history);
    }

    CardState before = card.state;
    ReviewOutcome out;
    if (card.state == CardState::REVIEW) {
        out = reviewScheduled(card, grade, elapsedDays);
    }
    else {
        out = reviewStep(card, grade);
    }

    if (out.interval_minutes > 0) {
        out.next_due = now + out.interval_minutes * SECONDS_PER_MINUTE;
        card.scheduled_days = out.interval_minutes / MINUTES_PER_DAY;
    }
    else {
        out.next_due = now + out.interval_days * SECONDS_PER_DAY;
        card.scheduled_days = out.interval_days;
    }

    card.elapsed_days = elapsedDays;
    card.reps += 1;
    card.last_review = now;
    card.due = out.next_due;

    if (grade >= Grade::GOOD) {
        card.consecutive_correct += 1;
    }
    else {
        card.consecutive_correct = 0;
    }

    spdlog::info("Review card {} | grade={} | {} -> {} | next in {}",
        card.id, gradeName(grade), stateName(before), stateName(card.state), out.intervalDisplay());
    spdlog::debug("Card {} stability={:.4f} difficulty={:.4f} elapsed={:.3f}d reps={} lapses={} streak={}",
        card.id, card.stability, card.difficulty, elapsedDays, card.reps, card.lapses, card.consecutive_correct);

    return out;
}

/* -------------------------
   Learning / relearning steps
   -------------------------
   Anki-style short intervals measured in minutes. Finishing the last
   step (or answering Easy) graduates the card into Review.
*/
ReviewOutcome Scheduler::reviewStep(Card& card, Grade grade) const {
    const std::vector<int>& steps =
        card.state == CardState::RELEARNING ? params.relearning_steps : params.learning_steps;
    ReviewOutcome out;

    if (grade == Grade::AGAIN) {
        card.learning_step = 0;
        card.state = card.state == CardState::NEW ? CardState::LEARNING : CardState::RELEARNING;
        out.interval_minutes = steps.front();
        return out;
    }

    if (grade == Grade::EASY) {
        card.state = CardState::REVIEW;
        card.learning_step = 0;
        card.stability = memory.initStability(grade);
        card.difficulty = memory.initDifficulty(grade);
        out.interval_days = params.easy_interval;
        return out;
    }

    // GOOD or HARD: advance one step
    card.learning_step += 1;
    if (card.learning_step >= static_cast<int>(steps.size())) {
        card.state = CardState::REVIEW;
        card.learning_step = 0;
        card.stability = memory.initStability(grade);
        card.difficulty = memory.initDifficulty(grade);
        out.interval_days = grade == Grade::HARD ? 1 : params.graduating_interval;
        return out;
    }

    if (card.state == CardState::NEW) card.state = CardState::LEARNING;
    out.interval_minutes = steps[card.learning_step];
    return out;
}

/* -------------------------
   FSRS review
   -------------------------
   Retrievability is taken at the real elapsed time since the last review.
*/
ReviewOutcome Scheduler::reviewScheduled(Card& card, Grade grade, double elapsedDays) const {
    double r = memory.retrievability(elapsedDays, card.stability);
    ReviewOutcome out;

    if (grade == Grade::AGAIN) {
        card.stability = memory.nextForgetStability(card.difficulty, card.stability, r);
        card.lapses += 1;
        card.state = CardState::RELEARNING;
        card.learning_step = 0;
        out.interval_minutes = params.relearning_steps.front();
        spdlog::warn("Card {} lapsed (r={:.3f}). lapses={}", card.id, r, card.lapses);
        return out;
    }

    card.stability = memory.nextReviewStability(card.difficulty, card.stability, r, grade);
    card.difficulty = memory.nextDifficulty(card.difficulty, grade);
    out.interval_days = std::min(memory.nextInterval(card.stability), params.maximum_interval);
    return out;
}
