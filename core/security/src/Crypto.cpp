#include "Crypto.h"
#include "Errors.h"
#include "Logger.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/kdf.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>  // For CRYPTO_memcmp, OPENSSL_cleanse
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace CipherLink {

using Core::ErrorCode;

std::vector<uint8_t> Crypto::randomBytes(size_t length) {
    std::vector<uint8_t> out(length);
    if (length > 0 && RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
        Logger::instance().log(LogLevel::ERROR, "RAND_bytes failed", "Crypto");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return out;
}

X25519KeyPair Crypto::generateX25519KeyPair() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!ctx) {
        throw CipherLinkError(ErrorCode::KEY_AGREEMENT_FAILED, "Failed to create X25519 context");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(ctx);
        throw CipherLinkError(ErrorCode::KEY_AGREEMENT_FAILED, "X25519 key generation failed");
    }
    EVP_PKEY_CTX_free(ctx);

    X25519KeyPair pair;
    pair.privateKey.resize(X25519_KEY_SIZE);
    pair.publicKey.resize(X25519_KEY_SIZE);
    size_t privLen = X25519_KEY_SIZE;
    size_t pubLen = X25519_KEY_SIZE;
    bool ok = EVP_PKEY_get_raw_private_key(pkey, pair.privateKey.data(), &privLen) == 1 &&
              EVP_PKEY_get_raw_public_key(pkey, pair.publicKey.data(), &pubLen) == 1;
    EVP_PKEY_free(pkey);

    if (!ok || privLen != X25519_KEY_SIZE || pubLen != X25519_KEY_SIZE) {
        secureWipe(pair.privateKey);
        throw CipherLinkError(ErrorCode::KEY_AGREEMENT_FAILED, "Failed to export X25519 key pair");
    }
    return pair;
}

std::vector<uint8_t> Crypto::x25519PublicFromPrivate(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != X25519_KEY_SIZE) {
        throw CipherLinkError(ErrorCode::INVALID_KEY, "X25519 private key must be 32 bytes");
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_X25519, nullptr, privateKey.data(), privateKey.size());
    if (!pkey) {
        throw CipherLinkError(ErrorCode::INVALID_KEY, "Invalid X25519 private key");
    }

    std::vector<uint8_t> publicKey(X25519_KEY_SIZE);
    size_t pubLen = X25519_KEY_SIZE;
    int rc = EVP_PKEY_get_raw_public_key(pkey, publicKey.data(), &pubLen);
    EVP_PKEY_free(pkey);

    if (rc != 1 || pubLen != X25519_KEY_SIZE) {
        throw CipherLinkError(ErrorCode::INVALID_KEY, "Failed to compute X25519 public key");
    }
    return publicKey;
}

std::vector<uint8_t> Crypto::x25519SharedSecret(
    const std::vector<uint8_t>& privateKey,
    const std::vector<uint8_t>& peerPublicKey
) {
    if (privateKey.size() != X25519_KEY_SIZE || peerPublicKey.size() != X25519_KEY_SIZE) {
        Logger::instance().log(LogLevel::ERROR, "Invalid X25519 key size", "Crypto");
        throw CipherLinkError(ErrorCode::INVALID_KEY, "X25519 keys must be 32 bytes");
    }

    EVP_PKEY* privKey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_X25519, nullptr, privateKey.data(), privateKey.size());
    EVP_PKEY* pubKey = EVP_PKEY_new_raw_public_key(
        EVP_PKEY_X25519, nullptr, peerPublicKey.data(), peerPublicKey.size());

    if (!privKey || !pubKey) {
        if (privKey) EVP_PKEY_free(privKey);
        if (pubKey) EVP_PKEY_free(pubKey);
        throw CipherLinkError(ErrorCode::INVALID_KEY, "Failed to load X25519 keys");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(privKey, nullptr);
    std::vector<uint8_t> sharedSecret(X25519_KEY_SIZE);
    size_t secretLen = sharedSecret.size();

    // EVP_PKEY_derive rejects all-zero output (low-order peer points)
    bool ok = ctx &&
              EVP_PKEY_derive_init(ctx) == 1 &&
              EVP_PKEY_derive_set_peer(ctx, pubKey) == 1 &&
              EVP_PKEY_derive(ctx, sharedSecret.data(), &secretLen) == 1 &&
              secretLen == X25519_KEY_SIZE;

    if (ctx) EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(privKey);
    EVP_PKEY_free(pubKey);

    if (!ok) {
        secureWipe(sharedSecret);
        Logger::instance().log(LogLevel::ERROR, "X25519 key agreement failed", "Crypto");
        throw CipherLinkError(ErrorCode::KEY_AGREEMENT_FAILED, "X25519 key agreement failed");
    }
    return sharedSecret;
}

std::vector<uint8_t> Crypto::hkdfSha256(
    const std::vector<uint8_t>& ikm,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& info,
    size_t length
) {
    if (ikm.empty()) {
        throw CipherLinkError(ErrorCode::INVALID_KEY, "HKDF input key material is empty");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!ctx) {
        throw CipherLinkError(ErrorCode::ENCRYPTION_FAILED, "Failed to create HKDF context");
    }

    std::vector<uint8_t> out(length);
    size_t outLen = length;

    bool ok = EVP_PKEY_derive_init(ctx) == 1 &&
              EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) == 1 &&
              (salt.empty() ||
               EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt.data(), static_cast<int>(salt.size())) == 1) &&
              EVP_PKEY_CTX_set1_hkdf_key(ctx, ikm.data(), static_cast<int>(ikm.size())) == 1 &&
              (info.empty() ||
               EVP_PKEY_CTX_add1_hkdf_info(ctx, info.data(), static_cast<int>(info.size())) == 1) &&
              EVP_PKEY_derive(ctx, out.data(), &outLen) == 1 &&
              outLen == length;

    EVP_PKEY_CTX_free(ctx);

    if (!ok) {
        secureWipe(out);
        Logger::instance().log(LogLevel::ERROR, "HKDF derivation failed", "Crypto");
        throw CipherLinkError(ErrorCode::ENCRYPTION_FAILED, "HKDF derivation failed");
    }
    return out;
}

std::vector<uint8_t> Crypto::encryptChaCha20Poly1305(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    if (key.size() != KEY_SIZE) {
        Logger::instance().log(LogLevel::ERROR, "Invalid key size for AEAD encryption", "Crypto");
        throw CipherLinkError(ErrorCode::INVALID_KEY, "Invalid key size");
    }
    if (nonce.size() != NONCE_SIZE) {
        Logger::instance().log(LogLevel::ERROR, "Invalid nonce size for AEAD encryption", "Crypto");
        throw CipherLinkError(ErrorCode::ENCRYPTION_FAILED, "Invalid nonce size (must be 12 bytes)");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw CipherLinkError(ErrorCode::ENCRYPTION_FAILED, "Failed to create cipher context");
    }

    auto fail = [ctx](const char* what) {
        EVP_CIPHER_CTX_free(ctx);
        return CipherLinkError(ErrorCode::ENCRYPTION_FAILED, what);
    };

    if (EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
        throw fail("Failed to initialize ChaCha20-Poly1305");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
        throw fail("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw fail("Failed to set key/nonce");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw fail("Failed to add AAD");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + TAG_SIZE);
    int ciphertextLen = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            throw fail("AEAD encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + ciphertextLen, &len) != 1) {
        throw fail("AEAD finalization failed");
    }
    ciphertextLen += len;

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE),
                            ciphertext.data() + ciphertextLen) != 1) {
        throw fail("Failed to get AEAD tag");
    }
    ciphertextLen += static_cast<int>(TAG_SIZE);

    EVP_CIPHER_CTX_free(ctx);

    ciphertext.resize(static_cast<size_t>(ciphertextLen));
    return ciphertext;
}

std::vector<uint8_t> Crypto::decryptChaCha20Poly1305(
    const std::vector<uint8_t>& ciphertextWithTag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& aad
) {
    if (key.size() != KEY_SIZE) {
        throw CipherLinkError(ErrorCode::INVALID_KEY, "Invalid key size");
    }
    if (nonce.size() != NONCE_SIZE) {
        throw CipherLinkError(ErrorCode::MALFORMED_PAYLOAD, "Invalid nonce size (must be 12 bytes)");
    }
    if (ciphertextWithTag.size() < TAG_SIZE) {
        throw AuthenticationFailedError("Ciphertext shorter than the authentication tag");
    }

    size_t ciphertextLen = ciphertextWithTag.size() - TAG_SIZE;
    std::vector<uint8_t> tag(ciphertextWithTag.end() - TAG_SIZE, ciphertextWithTag.end());

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw CipherLinkError(ErrorCode::ENCRYPTION_FAILED, "Failed to create cipher context");
    }

    auto fail = [ctx](const char* what) {
        EVP_CIPHER_CTX_free(ctx);
        return CipherLinkError(ErrorCode::ENCRYPTION_FAILED, what);
    };

    if (EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
        throw fail("Failed to initialize ChaCha20-Poly1305");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
        throw fail("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw fail("Failed to set key/nonce");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw fail("Failed to add AAD");
    }

    std::vector<uint8_t> plaintext(ciphertextLen + TAG_SIZE);
    int plaintextLen = 0;
    if (ciphertextLen > 0) {
        if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertextWithTag.data(),
                              static_cast<int>(ciphertextLen)) != 1) {
            throw fail("AEAD decryption failed");
        }
        plaintextLen = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        throw fail("Failed to set AEAD tag");
    }

    int rc = EVP_DecryptFinal_ex(ctx, plaintext.data() + plaintextLen, &len);
    EVP_CIPHER_CTX_free(ctx);

    if (rc <= 0) {
        secureWipe(plaintext);
        Logger::instance().log(LogLevel::WARN, "AEAD tag verification failed", "Crypto");
        throw AuthenticationFailedError("Authentication failed: ciphertext or context was modified");
    }
    plaintextLen += len;

    plaintext.resize(static_cast<size_t>(plaintextLen));
    return plaintext;
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Invalid hex string length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::string Crypto::toBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* bufPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufPtr);
    std::string result(bufPtr->data, bufPtr->length);
    BIO_free_all(bio);

    return result;
}

std::vector<uint8_t> Crypto::fromBase64(const std::string& encoded) {
    std::string normalized;
    normalized.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (c == '-') {
            normalized.push_back('+');
        } else if (c == '_') {
            normalized.push_back('/');
        } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=') {
            normalized.push_back(c);
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid base64 character");
        }
    }
    if (normalized.empty()) {
        return {};
    }
    while (normalized.size() % 4 != 0) {
        normalized.push_back('=');
    }

    BIO* bio = BIO_new_mem_buf(normalized.data(), static_cast<int>(normalized.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::vector<uint8_t> out(normalized.size() * 3 / 4);
    int decoded = BIO_read(bio, out.data(), static_cast<int>(out.size()));
    BIO_free_all(bio);

    if (decoded < 0) {
        throw std::invalid_argument("Invalid base64 input");
    }
    out.resize(static_cast<size_t>(decoded));
    return out;
}

std::string Crypto::toBase64Url(const std::vector<uint8_t>& data) {
    std::string encoded = toBase64(data);
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

bool Crypto::constantTimeCompare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void Crypto::secureWipe(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

} // namespace CipherLink
