#pragma once
#include <string>
#include <vector>
#include "KeyValueStore.hpp"

// Encrypted file per key, using libsodium.
//
// File layout:
//   Header: 8 bytes ASCII "RTDATA1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The secretbox key is derived from a passphrase with crypto_pwhash and a
// per-directory salt kept hex-encoded in <dir>/salt.hex (created on first use).
// Throws std::runtime_error when libsodium or key derivation fails.
class EncryptedFileStore : public KeyValueStore {
public:
    EncryptedFileStore(const std::string& dir, const std::string& passphrase);
    ~EncryptedFileStore() override;

    EncryptedFileStore(const EncryptedFileStore&) = delete;
    EncryptedFileStore& operator=(const EncryptedFileStore&) = delete;

    std::optional<std::string> load(const std::string& key) override;
    bool save(const std::string& key, const std::string& blob) override;

private:
    std::string directory;
    std::vector<unsigned char> secret; // derived key, wiped on destruction

    std::string pathFor(const std::string& key) const;
    std::vector<unsigned char> loadOrCreateSalt();
    void deriveKey(const std::string& passphrase, const std::vector<unsigned char>& salt);
};
