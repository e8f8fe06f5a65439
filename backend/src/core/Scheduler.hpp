#pragma once
#include <ctime>
#include <string>
#include <spdlog/spdlog.h>
#include "Card.hpp"
#include "MemoryModel.hpp"
#include "SchedulerParams.hpp"

// Result of a single review. Exactly one of minutes/days is non-zero
// unless the memory model produced a zero-day interval.
struct ReviewOutcome {
    int interval_minutes = 0;
    int interval_days = 0;
    std::time_t next_due = 0;

    double intervalInDays() const;
    std::string intervalDisplay() const; // "10m" or "4d"
};

/*
  Review state machine:
   - New / Learning / Relearning cards walk the short step schedule
   - Review cards are scheduled by the FSRS memory model
   - Lapses drop a Review card into Relearning
*/
class Scheduler {
public:
    explicit Scheduler(const SchedulerParams& params);

    // Applies a grade to the card at time `now` and returns the new schedule.
    // When `error` is given it is appended to the card's error history.
    ReviewOutcome review(Card& card, Grade grade, std::time_t now, const ErrorInfo* error = nullptr) const;

    const MemoryModel& model() const { return memory; }

private:
    const SchedulerParams& params;
    MemoryModel memory;

    ReviewOutcome reviewStep(Card& card, Grade grade) const;
    ReviewOutcome reviewScheduled(Card& card, Grade grade, double elapsedDays) const;
};
