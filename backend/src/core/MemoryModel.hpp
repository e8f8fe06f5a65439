#pragma once
#include "Card.hpp"
#include "SchedulerParams.hpp"

/*
  FSRS memory model. Every function is a pure computation over the
  weight vector; identical inputs produce identical outputs.

  Forgetting curve:  R(t, S) = (1 + t / (9 S))^-1
  Interval:          I(r, S) = 9 S (1/r - 1)
*/
class MemoryModel {
public:
    explicit MemoryModel(const SchedulerParams& params);

    double retrievability(double elapsedDays, double stability) const;
    int nextInterval(double stability) const;
    int nextInterval(double stability, double retention) const;

    double initStability(Grade g) const;
    double initDifficulty(Grade g) const;

    double nextReviewStability(double d, double s, double r, Grade g) const;
    double nextForgetStability(double d, double s, double r) const;
    double nextDifficulty(double d, Grade g) const;

private:
    const SchedulerParams& params;
};
