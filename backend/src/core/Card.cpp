#include "Card.hpp"

const char* gradeName(Grade g) {
    switch (g) {
    case Grade::AGAIN: return "again";
    case Grade::HARD: return "hard";
    case Grade::GOOD: return "good";
    case Grade::EASY: return "easy";
    }
    return "unknown";
}

const char* stateName(CardState s) {
    switch (s) {
    case CardState::NEW: return "new";
    case CardState::LEARNING: return "learning";
    case CardState::REVIEW: return "review";
    case CardState::RELEARNING: return "relearning";
    }
    return "unknown";
}

Card::Card(const DrillItem& item, std::time_t now)
    : id(item.id),
    due(now),
    pos_pattern(item.pos_pattern),
    commonality(item.commonality),
    unit(item.unit)
{
    spdlog::debug("Created card: ID={}, pattern='{}', commonality={:.2f}",
        id, pos_pattern, commonality);
}

void Card::recordError(const std::string& type, std::time_t when, std::size_t maxHistory) {
    error_history.push_back(ErrorRecord{ type, when });
    while (error_history.size() > maxHistory) {
        error_history.pop_front();
    }
    spdlog::debug("Card ID={} error '{}' recorded ({} in history)", id, type, error_history.size());
}

int Card::errorsSince(std::time_t since) const {
    int count = 0;
    for (const auto& e : error_history) {
        if (e.timestamp > since) ++count;
    }
    return count;
}

void Card::reset(std::time_t now) {
    DrillItem keep;
    keep.id = id;
    keep.pos_pattern = pos_pattern;
    keep.commonality = commonality;
    keep.unit = unit;
    *this = Card(keep, now);
    spdlog::info("Card ID={} reset to new", id);
}

Grade gradeFromErrors(const std::vector<ErrorInfo>& errors) {
    if (errors.empty()) return Grade::GOOD;
    if (errors.size() >= 3) return Grade::AGAIN;

    const std::string& primary = errors.front().type;
    if (primary == "grammar" || primary == "word_order") return Grade::AGAIN;
    if (primary == "spelling" || primary == "confusable") return Grade::HARD;

    return errors.size() > 1 ? Grade::AGAIN : Grade::HARD;
}
