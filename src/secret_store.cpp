#include "secret_store.hpp"
#include "util.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <sys/stat.h>

namespace clawlink {

namespace {

constexpr size_t kKeySize = 32;
constexpr size_t kNonceSize = 12;
constexpr size_t kTagSize = 16;
constexpr unsigned char kBlobVersion = 0x01;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

[[noreturn]] void fail_decrypt(const std::string& why) {
    throw SecretError(SecretErrorKind::DecryptFailure, "decrypt failed: " + why);
}

} // namespace

std::string key_file_path(const std::string& config_dir) {
    if (config_dir.empty()) return ".gateway_key";
    if (config_dir.back() == '/') return config_dir + ".gateway_key";
    return config_dir + "/.gateway_key";
}

SecretStore::SecretStore(std::string key_path)
    : key_path_(std::move(key_path))
{}

bool SecretStore::is_encrypted(const std::string& value) {
    return value.rfind(kEncryptedPrefix, 0) == 0;
}

bool SecretStore::key_exists() const {
    struct stat st{};
    return ::stat(key_path_.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<unsigned char> SecretStore::load_key() const {
    if (!key_exists()) {
        throw SecretError(SecretErrorKind::KeyMissing,
                          "key file not found: " + key_path_);
    }
    std::string raw;
    if (!read_file(key_path_, raw)) {
        throw SecretError(SecretErrorKind::KeyFileError,
                          "cannot read key file: " + key_path_);
    }
    if (raw.size() != kKeySize) {
        throw SecretError(SecretErrorKind::KeyFileError,
                          "key file has wrong size: " + key_path_);
    }
    return std::vector<unsigned char>(raw.begin(), raw.end());
}

std::vector<unsigned char> SecretStore::load_or_create_key() {
    if (key_exists()) return load_key();

    std::vector<unsigned char> key(kKeySize);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "RAND_bytes failed");
    }
    std::string raw(key.begin(), key.end());
    if (!atomic_write_file(key_path_, raw, true)) {
        throw SecretError(SecretErrorKind::KeyFileError,
                          "cannot write key file: " + key_path_);
    }
    std::cerr << "[secret] Created new key file: " << key_path_ << "\n";
    return key;
}

std::string SecretStore::encrypt(const std::string& plaintext) {
    auto key = load_or_create_key();

    unsigned char nonce[kNonceSize];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "RAND_bytes failed");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "cipher init failed");
    }

    std::vector<unsigned char> blob;
    blob.reserve(1 + kNonceSize + plaintext.size() + kTagSize);
    blob.push_back(kBlobVersion);
    blob.insert(blob.end(), nonce, nonce + kNonceSize);

    size_t body_at = blob.size();
    blob.resize(body_at + plaintext.size() + kTagSize);
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), blob.data() + body_at, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "encrypt failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), blob.data() + body_at + len, &final_len) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "encrypt final failed");
    }
    size_t tag_at = body_at + static_cast<size_t>(len + final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kTagSize), blob.data() + tag_at) != 1) {
        throw SecretError(SecretErrorKind::KeyFileError, "cannot read GCM tag");
    }
    blob.resize(tag_at + kTagSize);

    return std::string(kEncryptedPrefix) + base64_encode(blob.data(), blob.size());
}

std::string SecretStore::decrypt(const std::string& ciphertext) const {
    std::string encoded = is_encrypted(ciphertext)
        ? ciphertext.substr(std::char_traits<char>::length(kEncryptedPrefix))
        : ciphertext;

    auto key = load_key();

    std::vector<unsigned char> blob;
    if (!base64_decode(encoded, blob)) fail_decrypt("not base64");
    if (blob.size() < 1 + kNonceSize + kTagSize) fail_decrypt("blob too short");
    if (blob[0] != kBlobVersion) fail_decrypt("unknown blob version");

    const unsigned char* nonce = blob.data() + 1;
    const unsigned char* body = nonce + kNonceSize;
    size_t body_len = blob.size() - 1 - kNonceSize - kTagSize;
    unsigned char tag[kTagSize];
    std::copy(body + body_len, body + body_len + kTagSize, tag);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        fail_decrypt("cipher init failed");
    }

    std::string plain(body_len, '\0');
    int len = 0;
    if (body_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]), &len,
                          body, static_cast<int>(body_len)) != 1) {
        fail_decrypt("cipher update failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kTagSize), tag) != 1) {
        fail_decrypt("cannot set GCM tag");
    }
    int final_len = 0;
    unsigned char scratch[16];
    if (EVP_DecryptFinal_ex(ctx.get(), scratch, &final_len) != 1) {
        // Tag mismatch: wrong key or modified ciphertext
        fail_decrypt("authentication tag mismatch");
    }
    plain.resize(static_cast<size_t>(len));
    return plain;
}

std::string SecretStore::seal(const std::string& value) {
    if (value.empty() || is_encrypted(value)) return value;
    return encrypt(value);
}

std::string SecretStore::reveal(const std::string& value) const {
    if (!is_encrypted(value)) return value;
    return decrypt(value);
}

} // namespace clawlink
