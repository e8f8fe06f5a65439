#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

struct DrillMeta {
    std::optional<std::string> pattern_group;
    bool is_canonical = true;
};

// One metadata record as supplied by the drill catalog.
struct DrillMetaRecord {
    std::string id;
    std::optional<std::string> pattern_group;
    std::optional<bool> is_canonical; // defaults to true
};

/*
  Side table of pattern groups. Expected to declare at most one
  canonical card per group; this is not re-checked here.
*/
class DrillMetaTable {
public:
    std::unordered_map<std::string, DrillMeta> entries;

    void load(const std::vector<DrillMetaRecord>& records);

    const DrillMeta* find(const std::string& id) const;
    bool isCanonical(const std::string& id) const;
    void setCanonical(const std::string& id, bool canonical);

    std::size_t patternGroupCount() const;
    bool empty() const { return entries.empty(); }

    // Canonical flags only, one "id:0|1" line per entry.
    std::string serializeCanonical() const;
    void applyCanonical(const std::string& data);
};
