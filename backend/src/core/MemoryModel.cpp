#include "MemoryModel.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr double MIN_DIFFICULTY = 1.0;
constexpr double MAX_DIFFICULTY = 10.0;

int gradeValue(Grade g) { return static_cast<int>(g); }
}

MemoryModel::MemoryModel(const SchedulerParams& p)
    : params(p)
{
}

double MemoryModel::retrievability(double elapsedDays, double stability) const {
    if (stability <= 0) return 0.0;
    return std::pow(1.0 + elapsedDays / (9.0 * stability), -1.0);
}

int MemoryModel::nextInterval(double stability) const {
    return nextInterval(stability, params.request_retention);
}

int MemoryModel::nextInterval(double stability, double retention) const {
    if (stability <= 0) return 1;
    return static_cast<int>(std::round(9.0 * stability * (1.0 / retention - 1.0)));
}

double MemoryModel::initStability(Grade g) const {
    return params.w[gradeValue(g) - 1];
}

double MemoryModel::initDifficulty(Grade g) const {
    const auto& w = params.w;
    return std::clamp(w[4] - (gradeValue(g) - 3) * w[5], MIN_DIFFICULTY, MAX_DIFFICULTY);
}

double MemoryModel::nextReviewStability(double d, double s, double r, Grade g) const {
    const auto& w = params.w;
    double hardPenalty = g == Grade::HARD ? w[15] : 1.0;
    double easyBonus = g == Grade::EASY ? w[16] : 1.0;

    double sinc = std::exp(w[8]) *
        (11.0 - d) *
        std::pow(s, -w[9]) *
        (std::exp(w[10] * (1.0 - r)) - 1.0) *
        hardPenalty *
        easyBonus;

    return s * (sinc + 1.0);
}

double MemoryModel::nextForgetStability(double d, double s, double r) const {
    const auto& w = params.w;
    return w[11] *
        std::pow(d, -w[12]) *
        (std::pow(s + 1.0, w[13]) - 1.0) *
        std::exp(w[14] * (1.0 - r));
}

double MemoryModel::nextDifficulty(double d, Grade g) const {
    const auto& w = params.w;
    double d0 = initDifficulty(Grade::GOOD);
    double next = w[7] * d0 + (1.0 - w[7]) * (d - w[6] * (gradeValue(g) - 3));
    return std::clamp(next, MIN_DIFFICULTY, MAX_DIFFICULTY);
}
