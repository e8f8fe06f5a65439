#include "Persister.hpp"
#include <exception>
#include <system_error>
#include <spdlog/spdlog.h>

Persister::Persister(std::shared_ptr<KeyValueStore> s, bool asyncSave)
    : store(std::move(s)),
    async(asyncSave)
{
    spdlog::debug("Persister ready ({} saves)", async ? "async" : "sync");
}

Persister::~Persister() {
    flush();
}

void Persister::flush() {
    if (pending.valid()) {
        pending.wait();
        pending = std::future<void>();
    }
}

void Persister::write(const std::string& key, const std::string& blob) {
    if (!store) {
        spdlog::error("No storage configured; '{}' not saved", key);
        failed = true;
        return;
    }

    bool ok = false;
    try {
        ok = store->save(key, blob);
    }
    catch (const std::exception& e) {
        spdlog::error("Storage error while saving '{}': {}", key, e.what());
        ok = false;
    }

    if (!ok) {
        spdlog::warn("Save of '{}' failed; progress may not have been saved", key);
        failed = true;
    }
    else {
        spdlog::debug("Saved '{}' ({} bytes)", key, blob.size());
    }
}

void Persister::beginRound() {
    flush();
    failed = false;
}

bool Persister::lastSaveFailed() {
    flush();
    return failed.load();
}

void Persister::save(const std::string& key, std::string blob) {
    if (!async) {
        write(key, blob);
        return;
    }

    flush();
    try {
        pending = std::async(std::launch::async,
            [this, key, data = std::move(blob)]() { write(key, data); });
    }
    catch (const std::system_error& e) {
        spdlog::error("Could not dispatch save of '{}': {}", key, e.what());
        failed = true;
    }
}

std::optional<std::string> Persister::load(const std::string& key) {
    flush();
    if (!store) return std::nullopt;

    try {
        return store->load(key);
    }
    catch (const std::exception& e) {
        spdlog::error("Storage error while loading '{}': {}", key, e.what());
        return std::nullopt;
    }
}
