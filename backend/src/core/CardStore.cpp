#include "CardStore.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

static const char CARDS_HDR[] = "RETAIN-CARDS 1";
static const char BLOCK_END[] = "---";

Card* CardStore::find(const std::string& id) {
    auto it = cards.find(id);
    return it == cards.end() ? nullptr : &it->second;
}

const Card* CardStore::find(const std::string& id) const {
    auto it = cards.find(id);
    return it == cards.end() ? nullptr : &it->second;
}

bool CardStore::contains(const std::string& id) const {
    return cards.count(id) != 0;
}

bool CardStore::ensure(const DrillItem& item, std::time_t now) {
    if (item.id.empty()) {
        spdlog::warn("Refusing to create a card without id");
        return false;
    }
    if (contains(item.id)) return false;
    cards.emplace(item.id, Card(item, now));
    return true;
}

std::string CardStore::serialize() const {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << CARDS_HDR << "\n";

    for (const auto& p : cards) {
        const Card& c = p.second;
        oss << c.id << "\n"
            << c.due << " "
            << c.stability << " "
            << c.difficulty << " "
            << c.elapsed_days << " "
            << c.scheduled_days << " "
            << c.reps << " "
            << c.lapses << " "
            << static_cast<int>(c.state) << " "
            << c.last_review << " "
            << c.learning_step << "\n"
            << c.pos_pattern << "\n"
            << c.commonality << " " << c.unit << "\n"
            << (c.graduated ? 1 : 0) << " "
            << c.graduation_date << " "
            << c.consecutive_correct << "\n";

        oss << c.error_history.size() << "\n";
        for (const auto& e : c.error_history) {
            oss << e.timestamp << " " << e.type << "\n";
        }

        oss << BLOCK_END << "\n";
    }

    return oss.str();
}

static bool parseCardBlock(std::istream& in, Card& c) {
    std::string line;

    if (!std::getline(in, c.id) || c.id.empty()) return false;

    if (!std::getline(in, line)) return false;
    {
        std::istringstream ls(line);
        int state = 0;
        if (!(ls >> c.due >> c.stability >> c.difficulty >> c.elapsed_days >> c.scheduled_days
            >> c.reps >> c.lapses >> state >> c.last_review >> c.learning_step)) return false;
        if (state < 0 || state > static_cast<int>(CardState::RELEARNING)) return false;
        c.state = static_cast<CardState>(state);
    }

    if (!std::getline(in, c.pos_pattern)) return false;

    if (!std::getline(in, line)) return false;
    {
        std::istringstream ls(line);
        if (!(ls >> c.commonality >> c.unit)) return false;
    }

    if (!std::getline(in, line)) return false;
    {
        std::istringstream ls(line);
        int graduated = 0;
        if (!(ls >> graduated >> c.graduation_date >> c.consecutive_correct)) return false;
        c.graduated = graduated != 0;
    }

    if (!std::getline(in, line)) return false;
    std::size_t errorCount = 0;
    {
        std::istringstream ls(line);
        if (!(ls >> errorCount)) return false;
    }

    c.error_history.clear();
    for (std::size_t i = 0; i < errorCount; ++i) {
        if (!std::getline(in, line)) return false;
        std::istringstream ls(line);
        ErrorRecord e;
        if (!(ls >> e.timestamp)) return false;
        ls >> std::ws;
        std::getline(ls, e.type);
        c.error_history.push_back(e);
    }

    return true;
}

bool CardStore::deserialize(const std::string& blob) {
    std::istringstream iss(blob);
    std::string line;

    if (!std::getline(iss, line) || line != CARDS_HDR) {
        spdlog::error("Card data has an unknown header");
        return false;
    }

    std::map<std::string, Card> loaded;
    std::size_t skipped = 0;

    while (true) {
        std::ostringstream block;
        bool terminated = false;
        bool any = false;
        while (std::getline(iss, line)) {
            if (line == BLOCK_END) { terminated = true; break; }
            block << line << "\n";
            any = true;
        }
        if (!any && !terminated) break;

        std::istringstream bs(block.str());
        Card c;
        if (terminated && parseCardBlock(bs, c)) {
            std::string id = c.id;
            loaded[id] = std::move(c);
        }
        else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} malformed card block(s)", skipped);
    }

    cards = std::move(loaded);
    spdlog::info("Loaded {} cards", cards.size());
    return true;
}
