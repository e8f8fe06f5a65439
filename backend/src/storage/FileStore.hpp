#pragma once
#include <string>
#include "KeyValueStore.hpp"

// One plain file per key: <dir>/<key>.dat
class FileStore : public KeyValueStore {
public:
    explicit FileStore(const std::string& dir);

    std::optional<std::string> load(const std::string& key) override;
    bool save(const std::string& key, const std::string& blob) override;

    std::string pathFor(const std::string& key) const;

private:
    std::string directory;
};
