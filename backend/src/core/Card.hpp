#pragma once
#include <string>
#include <ctime>
#include <deque>
#include <vector>
#include <spdlog/spdlog.h>

// Ordinal values matter: several checks compare against GOOD.
enum class Grade {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

enum class CardState {
    NEW = 0,
    LEARNING = 1,
    REVIEW = 2,
    RELEARNING = 3
};

const char* gradeName(Grade g);
const char* stateName(CardState s);

struct ErrorRecord {
    std::string type;
    std::time_t timestamp = 0;
};

// Classified answer error handed in alongside a grade.
struct ErrorInfo {
    std::string type;
};

// Static per-item data a card is created from.
struct DrillItem {
    std::string id;
    std::string pos_pattern;
    double commonality = 0.5;
    int unit = 1;
};

class Card {
public:
    Card() = default;
    Card(const DrillItem& item, std::time_t now);

    std::string id;

    // Scheduler state
    std::time_t due = 0;
    double stability = 0.0;       // 0 until the card leaves New
    double difficulty = 0.0;      // [1..10] once initialized
    double elapsed_days = 0.0;    // display only
    double scheduled_days = 0.0;  // display only, fractional for learning steps
    int reps = 0;
    int lapses = 0;
    CardState state = CardState::NEW;
    std::time_t last_review = 0;  // 0 = never reviewed
    int learning_step = 0;

    // Spacing metadata
    std::string pos_pattern;
    double commonality = 0.5;
    int unit = 1;

    std::deque<ErrorRecord> error_history;

    // Drill graduation
    bool graduated = false;
    std::time_t graduation_date = 0;
    int consecutive_correct = 0;

    void recordError(const std::string& type, std::time_t when, std::size_t maxHistory);
    int errorsSince(std::time_t since) const;

    // Back to a fresh New card, keeping pos_pattern/commonality/unit.
    void reset(std::time_t now);

    bool isDue(std::time_t now) const { return due <= now; }
};

// Maps classified answer errors to a grade. No errors means GOOD.
Grade gradeFromErrors(const std::vector<ErrorInfo>& errors);
