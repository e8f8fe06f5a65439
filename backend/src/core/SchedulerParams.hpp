#pragma once
#include <array>
#include <vector>

/*
  Tunable scheduler configuration.
   - w: FSRS weight vector (17 entries)
   - learning/relearning steps are minutes, everything else in days unless noted
*/
struct SchedulerParams {
    static constexpr std::size_t WEIGHT_COUNT = 17;

    std::array<double, WEIGHT_COUNT> w{ {
        0.4, 0.6, 2.4, 5.8, 4.93, 0.94, 0.86, 0.01,
        1.49, 0.14, 0.94, 2.18, 0.05, 0.34, 1.26, 0.29, 2.61 } };

    double request_retention = 0.9;
    int maximum_interval = 36500;           // 100 years

    std::vector<int> learning_steps{ 1, 10 };
    std::vector<int> relearning_steps{ 1, 10 };
    int graduating_interval = 1;
    int easy_interval = 4;

    // Drill graduation (pattern variations retire from rotation)
    int graduation_consecutive = 5;
    double graduation_min_interval = 16.0;
    int reactivation_lapse_threshold = 2;
    int reactivation_window_days = 30;
    std::size_t reactivation_max_siblings = 3;

    std::size_t max_error_history = 10;
};
