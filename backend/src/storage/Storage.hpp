#pragma once
#include <string>
#include <vector>
#include "ProgressStore.hpp"
#include "../core/LearningSettings.hpp"

// File-backed ProgressStore. All records live in memory; open() loads the
// file and flush() rewrites it.
//
// Encrypted format:
//   Header: 8 bytes ASCII "VBDATA1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes (line-oriented plain text inside)
//
// The key is derived from the passphrase with Argon2id (crypto_pwhash,
// interactive limits) and wiped on close().
class EncryptedFileStore : public MemoryProgressStore {
public:
    explicit EncryptedFileStore(const std::string& filename);
    ~EncryptedFileStore() override;

    EncryptedFileStore(const EncryptedFileStore&) = delete;
    EncryptedFileStore& operator=(const EncryptedFileStore&) = delete;

    // Loads the file (a missing file is an empty store). Throws
    // StoreUnavailable on a bad header, wrong passphrase or corrupt body.
    void open(const std::string& passphrase);

    // Throws StoreUnavailable if not open or the file cannot be written
    void flush();

    void close();
    bool isOpen() const { return !key.empty(); }

    const std::string& path() const { return filename; }

private:
    std::string filename;
    std::vector<unsigned char> salt;
    std::vector<unsigned char> key;

    void deriveKey(const std::string& passphrase);
};

namespace Storage {
    // Plain text body inside the encrypted envelope
    std::string serializeStore(const StoreData& data);
    StoreData parseStore(const std::string& plain);

    // Settings are not secret: plain key:value file. Missing file keeps defaults.
    bool loadSettings(LearningSettings& settings, const std::string& filename);
    bool saveSettings(const LearningSettings& settings, const std::string& filename);
}
