#include "FileStore.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <spdlog/spdlog.h>

FileStore::FileStore(const std::string& dir)
    : directory(dir)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        spdlog::error("Failed to create data directory '{}': {}", directory, ec.message());
    }
    spdlog::info("FileStore opened at '{}'", directory);
}

std::string FileStore::pathFor(const std::string& key) const {
    return (std::filesystem::path(directory) / (key + ".dat")).string();
}

std::optional<std::string> FileStore::load(const std::string& key) {
    if (!isValidStoreKey(key)) {
        spdlog::error("Invalid store key '{}'", key);
        return std::nullopt;
    }

    std::string filename = pathFor(key);
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Data file '{}' not found; treating as empty", filename);
        return std::nullopt;
    }

    std::string blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    spdlog::debug("Read {} bytes from '{}'", blob.size(), filename);
    return blob;
}

bool FileStore::save(const std::string& key, const std::string& blob) {
    if (!isValidStoreKey(key)) {
        spdlog::error("Invalid store key '{}'", key);
        return false;
    }

    std::string filename = pathFor(key);
    std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing", tmp);
            return false;
        }
        out.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        if (!out) {
            spdlog::error("Short write to '{}'", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, filename, ec);
    if (ec) {
        spdlog::error("Failed to replace '{}': {}", filename, ec.message());
        return false;
    }
    return true;
}
