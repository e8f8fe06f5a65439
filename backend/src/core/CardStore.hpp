#pragma once
#include <ctime>
#include <map>
#include <string>
#include <vector>
#include "Card.hpp"

/*
  Authoritative set of cards keyed by drill id.

  Plain-text blob format (one card per block):
    RETAIN-CARDS 1
    <id>
    <due> <stability> <difficulty> <elapsed_days> <scheduled_days> <reps> <lapses> <state> <last_review> <learning_step>
    <pos_pattern>
    <commonality> <unit>
    <graduated> <graduation_date> <consecutive_correct>
    <error count>
    <timestamp> <type>      (repeated)
    ---
*/
class CardStore {
public:
    Card* find(const std::string& id);
    const Card* find(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Creates the card on first sight; existing cards are left alone.
    // Returns true when a card was created.
    bool ensure(const DrillItem& item, std::time_t now);

    std::map<std::string, Card>& all() { return cards; }
    const std::map<std::string, Card>& all() const { return cards; }
    std::size_t size() const { return cards.size(); }
    void clear() { cards.clear(); }

    std::string serialize() const;
    // Replaces the current set. Malformed blocks are skipped; returns false
    // when the header is missing.
    bool deserialize(const std::string& blob);

private:
    std::map<std::string, Card> cards;
};
