// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <crypto/ed25519.h>

#include <openssl/evp.h>

#include <memory>

namespace ed25519 {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MDCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

typedef std::unique_ptr<EVP_PKEY, PKeyDeleter> PKeyPtr;
typedef std::unique_ptr<EVP_MD_CTX, MDCtxDeleter> MDCtxPtr;

// Empty messages are legal; OpenSSL still wants a non-null pointer
const uint8_t* MessagePtr(const uint8_t* msg) {
    static const uint8_t empty = 0;
    return msg != nullptr ? msg : &empty;
}

} // namespace

bool GetPublicKey(const uint8_t seed[32], uint8_t pubkey[32]) {
    if (seed == nullptr || pubkey == nullptr) {
        return false;
    }
    PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, SEED_SIZE));
    if (!key) {
        return false;
    }
    size_t len = PUBKEY_SIZE;
    return EVP_PKEY_get_raw_public_key(key.get(), pubkey, &len) == 1 && len == PUBKEY_SIZE;
}

bool Sign(const uint8_t seed[32], const uint8_t* msg, size_t msg_len, uint8_t sig[64]) {
    if (seed == nullptr || sig == nullptr || (msg == nullptr && msg_len > 0)) {
        return false;
    }
    PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, SEED_SIZE));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if (!key || !ctx) {
        return false;
    }
    // Ed25519 is one-shot: no digest is configured
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    size_t len = SIGNATURE_SIZE;
    if (EVP_DigestSign(ctx.get(), sig, &len, MessagePtr(msg), msg_len) != 1) {
        return false;
    }
    return len == SIGNATURE_SIZE;
}

bool Verify(const uint8_t pubkey[32], const uint8_t* msg, size_t msg_len, const uint8_t sig[64]) {
    if (pubkey == nullptr || sig == nullptr || (msg == nullptr && msg_len > 0)) {
        return false;
    }
    PKeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pubkey, PUBKEY_SIZE));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if (!key || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), sig, SIGNATURE_SIZE, MessagePtr(msg), msg_len) == 1;
}

} // namespace ed25519
