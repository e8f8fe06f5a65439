#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "DrillMeta.hpp"

struct CatalogEntry {
    DrillItem item;
    DrillMetaRecord meta;
    std::string prompt;      // "english"
    std::string answer;      // "german_formal", or "german_informal" when only that is given
    std::string alt_answer;  // "german_informal" when both are given
};

/*
  Drill list in JSON:
    { "total_drills": N,
      "drills": [ { "id", "unit", "pattern_group", "is_canonical",
                    "pos_pattern", "commonality",
                    "english", "german_formal", "german_informal" }, ... ] }
  Only "id" is required. Missing or null pattern_group means no group,
  is_canonical defaults to true, commonality to 0.5 and unit to 1.
  Records with unusable values are skipped with a warning.
*/
class DrillCatalog {
public:
    std::vector<CatalogEntry> entries;

    // Empty result when the text is not JSON or has no "drills" array.
    static std::optional<DrillCatalog> parse(const std::string& text);
    static std::optional<DrillCatalog> loadFile(const std::string& path);

    std::vector<DrillItem> items() const;
    std::vector<DrillMetaRecord> metadata() const;
    const CatalogEntry* find(const std::string& id) const;
};
