#include "EncryptedFileStore.hpp"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RTDATA1\n";
static const char SALT_FILE[] = "salt.hex";

static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

// Helper: hex-encode bytes
static std::string toHex(const unsigned char* bin, std::size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bin, len);
    hex.resize(2 * len);
    return hex;
}

// Helper: hex string to bytes of an exact length
static bool fromHex(const std::string& hex, std::vector<unsigned char>& out, std::size_t expected) {
    out.resize(expected);
    std::size_t bin_len = 0;

    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        spdlog::error("Failed to convert hex salt to binary");
        return false;
    }

    if (bin_len != expected) {
        spdlog::error("Salt length mismatch while decoding");
        return false;
    }
    return true;
}

EncryptedFileStore::EncryptedFileStore(const std::string& dir, const std::string& passphrase)
    : directory(dir)
{
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        spdlog::error("Failed to create data directory '{}': {}", directory, ec.message());
    }

    deriveKey(passphrase, loadOrCreateSalt());
    spdlog::info("EncryptedFileStore opened at '{}'", directory);
}

EncryptedFileStore::~EncryptedFileStore() {
    if (!secret.empty()) {
        sodium_memzero(secret.data(), secret.size());
    }
}

std::string EncryptedFileStore::pathFor(const std::string& key) const {
    return (std::filesystem::path(directory) / (key + ".enc")).string();
}

std::vector<unsigned char> EncryptedFileStore::loadOrCreateSalt() {
    std::string saltPath = (std::filesystem::path(directory) / SALT_FILE).string();
    std::vector<unsigned char> salt;

    std::ifstream in(saltPath);
    if (in) {
        std::string hex;
        std::getline(in, hex);
        if (!fromHex(hex, salt, SALT_BYTES)) {
            throw std::runtime_error("corrupt salt file '" + saltPath + "'");
        }
        return salt;
    }

    salt.resize(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());

    std::ofstream out(saltPath, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write salt file '" + saltPath + "'");
    }
    out << toHex(salt.data(), salt.size()) << "\n";
    spdlog::info("Created new key salt in '{}'", saltPath);
    return salt;
}

void EncryptedFileStore::deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt) {
    spdlog::debug("Deriving storage key (not logging passphrase or salt)");

    secret.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(secret.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        secret.clear();
        spdlog::error("crypto_pwhash failed during key derivation");
        throw std::runtime_error("crypto_pwhash failed (out of memory)");
    }
}

std::optional<std::string> EncryptedFileStore::load(const std::string& key) {
    if (!isValidStoreKey(key)) {
        spdlog::error("Invalid store key '{}'", key);
        return std::nullopt;
    }

    std::string filename = pathFor(key);
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Encrypted file '{}' not found; treating as empty", filename);
        return std::nullopt;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return std::nullopt;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return std::nullopt;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return std::nullopt;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, secret.data()) != 0) {
        spdlog::error("Decryption of '{}' failed (wrong passphrase?)", filename);
        return std::nullopt;
    }

    return std::string(reinterpret_cast<const char*>(plain.data()), plain.size());
}

bool EncryptedFileStore::save(const std::string& key, const std::string& blob) {
    if (!isValidStoreKey(key)) {
        spdlog::error("Invalid store key '{}'", key);
        return false;
    }
    if (secret.size() != ENC_KEY_BYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(blob.data());
    unsigned long long plen = blob.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, secret.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::string filename = pathFor(key);
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    return static_cast<bool>(out);
}
