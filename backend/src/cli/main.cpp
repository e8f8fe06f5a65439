#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <sodium.h>
#include <limits>
#include <ctime>
#include <stdexcept>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../core/DrillCatalog.hpp"
#include "../core/StudySession.hpp"
#include "../storage/FileStore.hpp"
#include "../storage/EncryptedFileStore.hpp"

std::string formatTime(std::time_t t) {
    if (t == 0) return "never";
    char buf[32];
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tmv);
    return buf;
}

void printStats(const CardStats& s) {
    std::cout << "\n===== STATISTICS =====\n"
        << "Total cards:    " << s.total << "\n"
        << "  New:          " << s.new_cards << "\n"
        << "  Learning:     " << s.learning << "\n"
        << "  Review:       " << s.review << "\n"
        << "  Relearning:   " << s.relearning << "\n"
        << "Due now:        " << s.due_now << "\n"
        << "Mastered:       " << s.mastered << "\n"
        << "Avg stability:  " << s.avg_stability << " days\n"
        << "Avg difficulty: " << s.avg_difficulty << "\n"
        << "Total reviews:  " << s.total_reviews << "\n"
        << "Total lapses:   " << s.total_lapses << "\n"
        << "This session:   " << s.session.reviewed << " reviewed, "
        << s.session.correct << " correct, " << s.session.incorrect << " incorrect\n";
}

void printGraduation(const GraduationStats& g) {
    std::cout << "\n===== GRADUATION =====\n"
        << "Total:      " << g.total << "\n"
        << "Graduated:  " << g.graduated << " (" << g.percent_graduated << "%)\n"
        << "Active:     " << g.active << "\n"
        << "Patterns:   " << g.patterns << "\n";
}

void printCardLine(const Card& c) {
    std::cout << "   " << c.id
        << " [" << stateName(c.state) << "]"
        << " due " << formatTime(c.due)
        << " | reps=" << c.reps
        << " lapses=" << c.lapses
        << " errors=" << c.error_history.size()
        << (c.graduated ? " (graduated)" : "")
        << "\n";
}

// 0 = stop studying
int askQuality() {
    while (true) {
        std::cout << "\nHow did you do?\n"
            " 1 = AGAIN (Failed)\n"
            " 2 = HARD\n"
            " 3 = GOOD\n"
            " 4 = EASY\n"
            " 0 = Stop\n> ";
        int q;
        if (std::cin >> q && q >= 0 && q <= 4) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return q;
        }
        if (std::cin.eof()) return 0;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

void study(StudySession& session, const DrillCatalog& catalog) {
    session.buildSessionQueue();

    while (true) {
        Card* card = session.getNextCard();
        if (!card) {
            std::cout << "No cards due.\n";
            return;
        }
        std::string id = card->id;

        const CatalogEntry* entry = catalog.find(id);
        std::cout << "\n[" << stateName(card->state) << "] " << id << "\n";
        std::cout << "Prompt: " << (entry ? entry->prompt : id) << "\n";
        std::cout << "(press Enter to reveal)";
        std::string dummy;
        std::getline(std::cin, dummy);
        std::cout << "Answer: " << (entry ? entry->answer : std::string("(no answer text)")) << "\n";
        if (entry && !entry->alt_answer.empty()) {
            std::cout << "   or:  " << entry->alt_answer << "\n";
        }

        int q = askQuality();
        if (q == 0) return;

        ErrorInfo err;
        bool haveError = false;
        if (q <= 2) {
            std::cout << "Error type (spelling, grammar, word_order, confusable; blank for none): ";
            std::getline(std::cin, err.type);
            haveError = !err.type.empty();
        }

        auto result = session.processReview(id, static_cast<Grade>(q), haveError ? &err : nullptr);
        if (!result) {
            std::cout << "Card disappeared.\n";
            continue;
        }

        std::cout << "Next review in " << result->interval_display
            << " (" << formatTime(result->next_due) << ")\n";
        if (result->graduation == GraduationResult::GRADUATED) std::cout << "Graduated from rotation.\n";
        if (result->graduation == GraduationResult::SWAPPED) std::cout << "Retired; a sibling drill takes over.\n";
        if (result->reactivated > 0) std::cout << result->reactivated << " sibling drill(s) brought back.\n";

        if (session.saveFailed()) {
            std::cout << "Warning: progress may not have been saved.\n";
        }
    }
}

std::shared_ptr<KeyValueStore> openStore(const StorageConfig& cfg) {
    if (!cfg.encrypt) {
        return std::make_shared<FileStore>(cfg.data_dir);
    }

    std::string passphrase;
    std::cout << "Passphrase: ";
    std::getline(std::cin, passphrase);
    if (passphrase.empty()) {
        throw std::runtime_error("empty passphrase");
    }
    auto store = std::make_shared<EncryptedFileStore>(cfg.data_dir, passphrase);
    sodium_memzero(&passphrase[0], passphrase.size());
    return store;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <drills.json> [retain.conf]\n";
        return 2;
    }

    AppConfig cfg = Config::loadFile(argc > 2 ? argv[2] : "retain.conf");
    Log::init(cfg.log);

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    auto catalog = DrillCatalog::loadFile(argv[1]);
    if (!catalog) {
        std::cerr << "Cannot read drill catalog '" << argv[1] << "'\n";
        return 1;
    }

    std::shared_ptr<KeyValueStore> store;
    try {
        store = openStore(cfg.storage);
    }
    catch (const std::exception& e) {
        spdlog::error("Cannot open storage: {}", e.what());
        std::cerr << "Cannot open storage: " << e.what() << "\n";
        return 1;
    }

    SessionOptions opts;
    opts.storage_key = cfg.storage.key;
    opts.max_cards = cfg.session_max_cards;
    opts.async_persist = cfg.storage.async_persist;

    StudySession session(cfg.scheduler, store, opts);
    if (!session.load()) {
        std::cout << "Saved progress could not be read; starting fresh.\n";
    }
    session.loadDrillMeta(catalog->metadata());
    session.initializeCards(catalog->items());

    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Study\n"
            "2. Statistics\n"
            "3. Graduation statistics\n"
            "4. Pattern groups\n"
            "5. Problem cards\n"
            "6. Error distribution\n"
            "7. Reset a card\n"
            "8. Reset all cards\n"
            "9. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            study(session, *catalog);
        }

        else if (choice == 2) {
            printStats(session.getStats());
        }

        else if (choice == 3) {
            printGraduation(session.getGraduationStats());
        }

        else if (choice == 4) {
            for (const auto& g : session.getPatternGroups()) {
                std::cout << g.first << " (" << g.second.size() << ")\n";
                for (const Card* c : g.second) printCardLine(*c);
            }
        }

        else if (choice == 5) {
            auto cards = session.getProblematicCards();
            if (cards.empty()) std::cout << "No errors recorded.\n";
            for (const Card* c : cards) printCardLine(*c);
        }

        else if (choice == 6) {
            auto dist = session.getErrorDistribution();
            if (dist.empty()) std::cout << "No errors recorded.\n";
            for (const auto& p : dist) std::cout << p.first << " : " << p.second << "\n";
        }

        else if (choice == 7) {
            std::cout << "Card id: ";
            std::string id; std::getline(std::cin, id);
            if (!session.resetCard(id)) std::cout << "Not found.\n";
            else std::cout << "Card reset.\n";
        }

        else if (choice == 8) {
            std::cout << "Type YES to reset every card: ";
            std::string confirm; std::getline(std::cin, confirm);
            if (confirm == "YES") {
                session.resetAllCards();
                session.resetSessionStats();
                std::cout << "All cards reset.\n";
            }
        }

        else if (choice == 9) {
            break;
        }

        else std::cout << "Invalid.\n";
    }

    session.flush();
    if (session.saveFailed()) {
        std::cout << "Warning: last save failed; progress may be lost.\n";
        return 1;
    }
    std::cout << "Goodbye!\n";
    return 0;
}
