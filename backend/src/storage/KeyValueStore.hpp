#pragma once
#include <optional>
#include <string>

// Blob storage by key. save() may report failure or throw; callers
// treat either as non-fatal.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> load(const std::string& key) = 0;
    virtual bool save(const std::string& key, const std::string& blob) = 0;
};

// Keys become file names, so only [A-Za-z0-9_-] are accepted.
bool isValidStoreKey(const std::string& key);
