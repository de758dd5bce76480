#pragma once
#include <string>
#include <vector>
#include <stdexcept>

namespace clawlink {

// Prefix that distinguishes encrypted values from legacy plaintext
constexpr const char* kEncryptedPrefix = "enc:";

enum class SecretErrorKind {
    KeyMissing,      // key file absent
    DecryptFailure,  // malformed blob, wrong key, or tampered ciphertext
    KeyFileError,    // key file unreadable, wrong size, or cannot be written
};

class SecretError : public std::runtime_error {
public:
    SecretError(SecretErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    SecretErrorKind kind() const { return kind_; }

private:
    SecretErrorKind kind_;
};

// AES-256-GCM encryption of credential material with a locally held key.
//
// Stored form: "enc:" + base64(0x01 | nonce[12] | ciphertext | tag[16]).
// The key file holds 32 raw bytes and is created (mode 0600) the first time
// encrypt() runs without one. decrypt() never creates a key.
class SecretStore {
public:
    explicit SecretStore(std::string key_path);

    // Throws SecretError(KeyFileError) if a key cannot be loaded or created.
    std::string encrypt(const std::string& plaintext);

    // Throws SecretError(KeyMissing | DecryptFailure | KeyFileError).
    // Accepts the value with or without the "enc:" prefix.
    std::string decrypt(const std::string& ciphertext) const;

    // Encrypt for persistence; empty stays empty.
    std::string seal(const std::string& value);

    // Unmarked values pass through unchanged; marked values are decrypted.
    std::string reveal(const std::string& value) const;

    bool key_exists() const;
    const std::string& key_path() const { return key_path_; }

    static bool is_encrypted(const std::string& value);

private:
    std::string key_path_;

    std::vector<unsigned char> load_key() const;
    std::vector<unsigned char> load_or_create_key();
};

// Key file location beside the config file: <config_dir>/.gateway_key
std::string key_file_path(const std::string& config_dir);

} // namespace clawlink
