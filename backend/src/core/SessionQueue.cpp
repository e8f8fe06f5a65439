#include "SessionQueue.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

SessionQueue::SessionQueue(std::size_t maxCards)
    : limit(maxCards)
{
}

std::vector<Card*> SessionQueue::dueCards(CardStore& store, std::time_t now) {
    std::vector<Card*> due;
    due.reserve(store.size() / 4 + 8);

    for (auto& p : store.all()) {
        Card& c = p.second;
        if (c.graduated) continue;
        if (c.isDue(now) || c.state == CardState::NEW) {
            due.push_back(&c);
        }
    }
    return due;
}

const std::deque<Card*>& SessionQueue::build(CardStore& store, std::time_t now) {
    return build(store, now, limit);
}

const std::deque<Card*>& SessionQueue::build(CardStore& store, std::time_t now, std::size_t maxCards) {
    std::vector<Card*> due = dueCards(store, now);

    std::stable_sort(due.begin(), due.end(),
        [](const Card* a, const Card* b) {
            bool aNew = a->state == CardState::NEW;
            bool bNew = b->state == CardState::NEW;
            if (aNew != bNew) return aNew;
            if (aNew) return a->commonality > b->commonality;
            return a->due < b->due;
        });

    if (due.size() > maxCards) due.resize(maxCards);
    queue.assign(due.begin(), due.end());

    spdlog::debug("Session queue built: {} card(s), cap {}", queue.size(), maxCards);
    return queue;
}

Card* SessionQueue::next(CardStore& store, std::time_t now) {
    if (queue.empty()) {
        build(store, now);
    }
    if (queue.empty()) {
        spdlog::info("No cards due");
        return nullptr;
    }

    // single rotation: pull the first different pattern to the front
    if (lastPattern && !lastPattern->empty()) {
        auto it = std::find_if(queue.begin(), queue.end(),
            [this](const Card* c) { return c->pos_pattern != *lastPattern; });
        if (it != queue.end() && it != queue.begin()) {
            Card* c = *it;
            queue.erase(it);
            queue.push_front(c);
        }
    }

    Card* front = queue.front();
    queue.pop_front();
    return front;
}
