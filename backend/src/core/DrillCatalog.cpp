#include "DrillCatalog.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

static std::string textField(const json& d, const char* key) {
    auto it = d.find(key);
    if (it == d.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Throws std::invalid_argument on values the scheduler cannot use.
static CatalogEntry parseDrill(const json& d) {
    if (!d.is_object()) throw std::invalid_argument("not an object");

    CatalogEntry e;
    auto id = d.find("id");
    if (id == d.end()) throw std::invalid_argument("missing id");
    if (id->is_string()) e.item.id = id->get<std::string>();
    else if (id->is_number_integer()) e.item.id = std::to_string(id->get<long long>());
    else throw std::invalid_argument("id must be a string or integer");
    if (e.item.id.empty()) throw std::invalid_argument("empty id");

    e.item.pos_pattern = textField(d, "pos_pattern");

    auto common = d.find("commonality");
    if (common != d.end() && !common->is_null()) {
        if (!common->is_number()) throw std::invalid_argument("commonality must be a number");
        double c = common->get<double>();
        if (!std::isfinite(c) || c < 0.0 || c > 1.0) throw std::invalid_argument("commonality outside [0,1]");
        e.item.commonality = c;
    }

    auto unit = d.find("unit");
    if (unit != d.end() && !unit->is_null()) {
        if (!unit->is_number_integer()) throw std::invalid_argument("unit must be an integer");
        e.item.unit = unit->get<int>();
    }

    e.meta.id = e.item.id;
    auto group = d.find("pattern_group");
    if (group != d.end() && !group->is_null()) {
        if (group->is_string() && !group->get<std::string>().empty()) {
            e.meta.pattern_group = group->get<std::string>();
        }
        else if (!group->is_string()) {
            spdlog::warn("Drill {}: pattern_group is not a string; treated as ungrouped", e.item.id);
        }
    }

    auto canonical = d.find("is_canonical");
    if (canonical != d.end() && !canonical->is_null()) {
        if (canonical->is_boolean()) e.meta.is_canonical = canonical->get<bool>();
        else spdlog::warn("Drill {}: is_canonical is not a boolean; using default", e.item.id);
    }

    e.prompt = textField(d, "english");
    std::string formal = textField(d, "german_formal");
    std::string informal = textField(d, "german_informal");
    if (formal.empty()) {
        e.answer = informal;
    }
    else {
        e.answer = formal;
        e.alt_answer = informal;
    }
    return e;
}

std::optional<DrillCatalog> DrillCatalog::parse(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    }
    catch (const json::parse_error& ex) {
        spdlog::error("Drill catalog is not valid JSON: {}", ex.what());
        return std::nullopt;
    }

    if (!doc.is_object() || !doc.contains("drills") || !doc["drills"].is_array()) {
        spdlog::error("Drill catalog has no \"drills\" array");
        return std::nullopt;
    }

    DrillCatalog catalog;
    std::size_t index = 0;
    for (const auto& d : doc["drills"]) {
        try {
            catalog.entries.push_back(parseDrill(d));
        }
        catch (const std::exception& ex) {
            spdlog::warn("Drill catalog record {}: {}; skipped", index, ex.what());
        }
        ++index;
    }

    if (doc.contains("total_drills") && doc["total_drills"].is_number_integer() &&
        doc["total_drills"].get<long long>() != static_cast<long long>(index)) {
        spdlog::warn("Drill catalog declares {} drills but lists {}", doc["total_drills"].get<long long>(), index);
    }

    spdlog::info("Drill catalog parsed: {} drills", catalog.entries.size());
    return catalog;
}

std::optional<DrillCatalog> DrillCatalog::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Drill catalog '{}' not found", path);
        return std::nullopt;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

std::vector<DrillItem> DrillCatalog::items() const {
    std::vector<DrillItem> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(e.item);
    return out;
}

std::vector<DrillMetaRecord> DrillCatalog::metadata() const {
    std::vector<DrillMetaRecord> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(e.meta);
    return out;
}

const CatalogEntry* DrillCatalog::find(const std::string& id) const {
    for (const auto& e : entries) {
        if (e.item.id == id) return &e;
    }
    return nullptr;
}
