#pragma once
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "CardStore.hpp"

/*
  Transient list of cards for the current sitting. Holds pointers into
  the CardStore; rebuild after the store's card set is replaced.
*/
class SessionQueue {
public:
    static constexpr std::size_t DEFAULT_MAX_CARDS = 20;

    explicit SessionQueue(std::size_t maxCards = DEFAULT_MAX_CARDS);

    // Non-graduated cards that are due or still New, unordered.
    static std::vector<Card*> dueCards(CardStore& store, std::time_t now);

    // New first (most common first), then by due date; capped.
    const std::deque<Card*>& build(CardStore& store, std::time_t now);
    const std::deque<Card*>& build(CardStore& store, std::time_t now, std::size_t maxCards);

    // Next card, avoiding the pattern drawn last time. nullptr when nothing is due.
    Card* next(CardStore& store, std::time_t now);

    void notePattern(const std::string& pattern) { lastPattern = pattern; }
    const std::optional<std::string>& lastDrawnPattern() const { return lastPattern; }

    const std::deque<Card*>& cards() const { return queue; }
    std::size_t size() const { return queue.size(); }
    bool empty() const { return queue.empty(); }
    void clear() { queue.clear(); }

    std::size_t maxCards() const { return limit; }

private:
    std::size_t limit;
    std::deque<Card*> queue;
    std::optional<std::string> lastPattern;
};
