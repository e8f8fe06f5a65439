#include "DrillMeta.hpp"
#include <sstream>
#include <unordered_set>

void DrillMetaTable::load(const std::vector<DrillMetaRecord>& records) {
    std::size_t noGroup = 0;
    for (const auto& r : records) {
        if (r.id.empty()) {
            spdlog::warn("Skipping drill metadata record without id");
            continue;
        }
        DrillMeta m;
        if (r.pattern_group && !r.pattern_group->empty()) {
            m.pattern_group = r.pattern_group;
        }
        else {
            ++noGroup;
        }
        m.is_canonical = r.is_canonical.value_or(true);
        entries[r.id] = m;
    }
    spdlog::info("Loaded drill metadata for {} drills ({} without pattern group)", records.size(), noGroup);
}

const DrillMeta* DrillMetaTable::find(const std::string& id) const {
    auto it = entries.find(id);
    if (it == entries.end()) return nullptr;
    return &it->second;
}

bool DrillMetaTable::isCanonical(const std::string& id) const {
    const DrillMeta* m = find(id);
    return m && m->is_canonical;
}

void DrillMetaTable::setCanonical(const std::string& id, bool canonical) {
    auto it = entries.find(id);
    if (it == entries.end()) {
        spdlog::warn("setCanonical: no metadata for drill '{}'", id);
        return;
    }
    it->second.is_canonical = canonical;
}

std::size_t DrillMetaTable::patternGroupCount() const {
    std::unordered_set<std::string> groups;
    for (const auto& p : entries) {
        if (p.second.pattern_group) groups.insert(*p.second.pattern_group);
    }
    return groups.size();
}

std::string DrillMetaTable::serializeCanonical() const {
    std::ostringstream oss;
    for (const auto& p : entries) {
        oss << p.first << ":" << (p.second.is_canonical ? 1 : 0) << "\n";
    }
    return oss.str();
}

void DrillMetaTable::applyCanonical(const std::string& data) {
    std::istringstream iss(data);
    std::string line;
    std::size_t applied = 0;

    while (std::getline(iss, line)) {
        auto pos = line.rfind(':');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        if (key.empty() || (val != "0" && val != "1")) {
            spdlog::warn("Ignoring malformed canonical flag line '{}'", line);
            continue;
        }

        auto it = entries.find(key);
        if (it == entries.end()) continue;
        it->second.is_canonical = val == "1";
        ++applied;
    }
    spdlog::debug("Applied {} saved canonical flags", applied);
}
