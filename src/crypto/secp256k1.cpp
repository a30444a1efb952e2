// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <crypto/secp256k1.h>
#include <crypto/hmac_sha512.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <memory>
#include <stdexcept>

namespace secp256k1 {

namespace {

struct BNDeleter {
    void operator()(BIGNUM* p) const { BN_clear_free(p); }
};
struct BNCtxDeleter {
    void operator()(BN_CTX* p) const { BN_CTX_free(p); }
};
struct ECGroupDeleter {
    void operator()(EC_GROUP* p) const { EC_GROUP_free(p); }
};
struct ECPointDeleter {
    void operator()(EC_POINT* p) const { EC_POINT_clear_free(p); }
};

typedef std::unique_ptr<BIGNUM, BNDeleter> BNPtr;
typedef std::unique_ptr<BN_CTX, BNCtxDeleter> BNCtxPtr;
typedef std::unique_ptr<EC_GROUP, ECGroupDeleter> ECGroupPtr;
typedef std::unique_ptr<EC_POINT, ECPointDeleter> ECPointPtr;

/**
 * Curve group, its order and a scratch context for one operation
 */
struct Curve {
    ECGroupPtr group;
    BNCtxPtr ctx;
    BNPtr order;
    BNPtr half_order;

    bool Init() {
        group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
        ctx.reset(BN_CTX_new());
        order.reset(BN_new());
        half_order.reset(BN_new());
        if (!group || !ctx || !order || !half_order) {
            return false;
        }
        if (EC_GROUP_get_order(group.get(), order.get(), ctx.get()) != 1) {
            return false;
        }
        return BN_rshift1(half_order.get(), order.get()) == 1;
    }
};

BNPtr NewBN(const uint8_t* bytes, size_t len) {
    return BNPtr(BN_bin2bn(bytes, static_cast<int>(len), nullptr));
}

bool ToBytes32(const BIGNUM* bn, uint8_t out[32]) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

// 0 < k < n
bool InRange(const Curve& curve, const BIGNUM* k) {
    return !BN_is_zero(k) && !BN_is_negative(k) && BN_cmp(k, curve.order.get()) < 0;
}

bool EncodePoint(const Curve& curve, const EC_POINT* point, bool compressed,
                 std::vector<uint8_t>& out) {
    point_conversion_form_t form = compressed ? POINT_CONVERSION_COMPRESSED
                                              : POINT_CONVERSION_UNCOMPRESSED;
    size_t len = EC_POINT_point2oct(curve.group.get(), point, form, nullptr, 0, curve.ctx.get());
    if (len == 0) {
        return false;
    }
    std::vector<uint8_t> buf(len);
    if (EC_POINT_point2oct(curve.group.get(), point, form, buf.data(), len, curve.ctx.get()) != len) {
        return false;
    }
    out.swap(buf);
    return true;
}

/**
 * RFC 6979 section 3.2 deterministic nonce generator (HMAC-SHA256, qlen = 256)
 */
class CNonceGenerator {
private:
    uint8_t K[32];
    uint8_t V[32];

    void Update(const uint8_t* key, const uint8_t* h1, uint8_t marker) {
        uint8_t buf[32 + 1 + 32 + 32];
        std::memcpy(buf, V, 32);
        buf[32] = marker;
        std::memcpy(buf + 33, key, 32);
        std::memcpy(buf + 65, h1, 32);
        HMAC_SHA256(K, 32, buf, sizeof(buf), K);
        HMAC_SHA256(K, 32, V, 32, V);
        OPENSSL_cleanse(buf, sizeof(buf));
    }

public:
    CNonceGenerator(const uint8_t key[32], const uint8_t h1[32]) {
        std::memset(V, 0x01, sizeof(V));
        std::memset(K, 0x00, sizeof(K));
        Update(key, h1, 0x00);
        Update(key, h1, 0x01);
    }

    ~CNonceGenerator() {
        OPENSSL_cleanse(K, sizeof(K));
        OPENSSL_cleanse(V, sizeof(V));
    }

    void Generate(uint8_t out[32]) {
        HMAC_SHA256(K, 32, V, 32, V);
        std::memcpy(out, V, 32);
    }

    // Called when a candidate k is out of range or gives r == 0 or s == 0
    void Reseed() {
        uint8_t buf[33];
        std::memcpy(buf, V, 32);
        buf[32] = 0x00;
        HMAC_SHA256(K, 32, buf, sizeof(buf), K);
        HMAC_SHA256(K, 32, V, 32, V);
    }
};

bool DecodePublicKey(const Curve& curve, const std::vector<uint8_t>& pubkey, EC_POINT* point) {
    if (pubkey.size() != COMPRESSED_PUBKEY_SIZE && pubkey.size() != UNCOMPRESSED_PUBKEY_SIZE) {
        return false;
    }
    return EC_POINT_oct2point(curve.group.get(), point, pubkey.data(), pubkey.size(),
                              curve.ctx.get()) == 1;
}

} // namespace

bool IsValidPrivateKey(const uint8_t key[32]) {
    if (key == nullptr) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    BNPtr k = NewBN(key, 32);
    return k && InRange(curve, k.get());
}

bool GetPublicKey(const uint8_t key[32], bool compressed, std::vector<uint8_t>& pubkey) {
    if (key == nullptr) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    BNPtr k = NewBN(key, 32);
    if (!k || !InRange(curve, k.get())) {
        return false;
    }
    ECPointPtr point(EC_POINT_new(curve.group.get()));
    if (!point ||
        EC_POINT_mul(curve.group.get(), point.get(), k.get(), nullptr, nullptr, curve.ctx.get()) != 1) {
        return false;
    }
    return EncodePoint(curve, point.get(), compressed, pubkey);
}

bool PrivateKeyTweakAdd(const uint8_t key[32], const uint8_t tweak[32], uint8_t out[32]) {
    if (key == nullptr || tweak == nullptr || out == nullptr) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    BNPtr k = NewBN(key, 32);
    BNPtr t = NewBN(tweak, 32);
    BNPtr sum(BN_new());
    if (!k || !t || !sum) {
        return false;
    }
    if (!InRange(curve, k.get()) || BN_cmp(t.get(), curve.order.get()) >= 0) {
        return false;
    }
    if (BN_mod_add(sum.get(), k.get(), t.get(), curve.order.get(), curve.ctx.get()) != 1) {
        return false;
    }
    if (BN_is_zero(sum.get())) {
        return false;
    }
    return ToBytes32(sum.get(), out);
}

bool Sign(const uint8_t key[32], const uint8_t hash[32], Signature& sig) {
    if (key == nullptr || hash == nullptr) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }

    const BIGNUM* n = curve.order.get();
    BN_CTX* ctx = curve.ctx.get();

    BNPtr d = NewBN(key, 32);
    BNPtr e = NewBN(hash, 32);
    if (!d || !e || !InRange(curve, d.get())) {
        return false;
    }

    // h1 = bits2octets(hash): the hash reduced mod n
    uint8_t h1[32];
    BNPtr e_mod(BN_dup(e.get()));
    if (!e_mod) {
        return false;
    }
    if (BN_cmp(e_mod.get(), n) >= 0 && BN_sub(e_mod.get(), e_mod.get(), n) != 1) {
        return false;
    }
    if (!ToBytes32(e_mod.get(), h1)) {
        return false;
    }

    BNPtr r(BN_new());
    BNPtr s(BN_new());
    BNPtr k_inv(BN_new());
    BNPtr tmp(BN_new());
    BNPtr x(BN_new());
    BNPtr y(BN_new());
    ECPointPtr R(EC_POINT_new(curve.group.get()));
    if (!r || !s || !k_inv || !tmp || !x || !y || !R) {
        return false;
    }

    try {
        CNonceGenerator rng(key, h1);
        uint8_t kbytes[32];

        // Each retry has probability ~2^-128; bound the loop regardless
        for (int attempt = 0; attempt < 64; attempt++) {
            rng.Generate(kbytes);
            BNPtr k = NewBN(kbytes, 32);
            OPENSSL_cleanse(kbytes, sizeof(kbytes));
            if (!k) {
                return false;
            }
            if (!InRange(curve, k.get())) {
                rng.Reseed();
                continue;
            }

            if (EC_POINT_mul(curve.group.get(), R.get(), k.get(), nullptr, nullptr, ctx) != 1 ||
                EC_POINT_get_affine_coordinates(curve.group.get(), R.get(), x.get(), y.get(), ctx) != 1) {
                return false;
            }
            if (BN_nnmod(r.get(), x.get(), n, ctx) != 1) {
                return false;
            }
            if (BN_is_zero(r.get())) {
                rng.Reseed();
                continue;
            }

            int recid = (BN_is_odd(y.get()) ? 1 : 0) | (BN_cmp(x.get(), n) >= 0 ? 2 : 0);

            // s = k^-1 (e + r*d) mod n
            if (BN_mod_inverse(k_inv.get(), k.get(), n, ctx) == nullptr ||
                BN_mod_mul(tmp.get(), r.get(), d.get(), n, ctx) != 1 ||
                BN_mod_add(tmp.get(), tmp.get(), e.get(), n, ctx) != 1 ||
                BN_mod_mul(s.get(), k_inv.get(), tmp.get(), n, ctx) != 1) {
                return false;
            }
            if (BN_is_zero(s.get())) {
                rng.Reseed();
                continue;
            }

            // Low-S: negating s mirrors R, which flips the parity bit
            if (BN_cmp(s.get(), curve.half_order.get()) > 0) {
                if (BN_sub(s.get(), n, s.get()) != 1) {
                    return false;
                }
                recid ^= 1;
            }

            if (!ToBytes32(r.get(), sig.r) || !ToBytes32(s.get(), sig.s)) {
                return false;
            }
            sig.recid = recid;
            return true;
        }
    } catch (const std::exception&) {
        return false;
    }

    return false;
}

bool Verify(const std::vector<uint8_t>& pubkey, const uint8_t hash[32], const Signature& sig) {
    if (hash == nullptr) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    const BIGNUM* n = curve.order.get();
    BN_CTX* ctx = curve.ctx.get();

    ECPointPtr Q(EC_POINT_new(curve.group.get()));
    if (!Q || !DecodePublicKey(curve, pubkey, Q.get())) {
        return false;
    }

    BNPtr r = NewBN(sig.r, 32);
    BNPtr s = NewBN(sig.s, 32);
    BNPtr e = NewBN(hash, 32);
    BNPtr w(BN_new());
    BNPtr u1(BN_new());
    BNPtr u2(BN_new());
    BNPtr x(BN_new());
    BNPtr v(BN_new());
    ECPointPtr X(EC_POINT_new(curve.group.get()));
    if (!r || !s || !e || !w || !u1 || !u2 || !x || !v || !X) {
        return false;
    }
    if (!InRange(curve, r.get()) || !InRange(curve, s.get())) {
        return false;
    }

    // X = (e/s)G + (r/s)Q; valid iff X.x mod n == r
    if (BN_mod_inverse(w.get(), s.get(), n, ctx) == nullptr ||
        BN_mod_mul(u1.get(), e.get(), w.get(), n, ctx) != 1 ||
        BN_mod_mul(u2.get(), r.get(), w.get(), n, ctx) != 1 ||
        EC_POINT_mul(curve.group.get(), X.get(), u1.get(), Q.get(), u2.get(), ctx) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), X.get())) {
        return false;
    }
    if (EC_POINT_get_affine_coordinates(curve.group.get(), X.get(), x.get(), nullptr, ctx) != 1 ||
        BN_nnmod(v.get(), x.get(), n, ctx) != 1) {
        return false;
    }
    return BN_cmp(v.get(), r.get()) == 0;
}

bool RecoverPublicKey(const uint8_t hash[32], const Signature& sig, bool compressed,
                      std::vector<uint8_t>& pubkey) {
    if (hash == nullptr || sig.recid < 0 || sig.recid > 3) {
        return false;
    }
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    const BIGNUM* n = curve.order.get();
    BN_CTX* ctx = curve.ctx.get();

    BNPtr r = NewBN(sig.r, 32);
    BNPtr s = NewBN(sig.s, 32);
    BNPtr e = NewBN(hash, 32);
    BNPtr x(BN_new());
    BNPtr p(BN_new());
    BNPtr r_inv(BN_new());
    BNPtr u1(BN_new());
    BNPtr u2(BN_new());
    ECPointPtr R(EC_POINT_new(curve.group.get()));
    ECPointPtr Q(EC_POINT_new(curve.group.get()));
    if (!r || !s || !e || !x || !p || !r_inv || !u1 || !u2 || !R || !Q) {
        return false;
    }
    if (!InRange(curve, r.get()) || !InRange(curve, s.get())) {
        return false;
    }

    // R.x = r (+ n when the x coordinate overflowed the order)
    if (!BN_copy(x.get(), r.get())) {
        return false;
    }
    if (sig.recid & 2) {
        if (EC_GROUP_get_curve(curve.group.get(), p.get(), nullptr, nullptr, ctx) != 1 ||
            BN_add(x.get(), x.get(), n) != 1 ||
            BN_cmp(x.get(), p.get()) >= 0) {
            return false;
        }
    }
    if (EC_POINT_set_compressed_coordinates(curve.group.get(), R.get(), x.get(),
                                            sig.recid & 1, ctx) != 1) {
        return false;
    }

    // Q = r^-1 (sR - eG)
    if (BN_mod_inverse(r_inv.get(), r.get(), n, ctx) == nullptr ||
        BN_mod_mul(u1.get(), e.get(), r_inv.get(), n, ctx) != 1 ||
        BN_mod_sub(u1.get(), n, u1.get(), n, ctx) != 1 ||
        BN_mod_mul(u2.get(), s.get(), r_inv.get(), n, ctx) != 1 ||
        EC_POINT_mul(curve.group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), Q.get())) {
        return false;
    }
    return EncodePoint(curve, Q.get(), compressed, pubkey);
}

bool EncodeDER(const Signature& sig, std::vector<uint8_t>& der) {
    ECDSA_SIG* ecsig = ECDSA_SIG_new();
    if (ecsig == nullptr) {
        return false;
    }
    BIGNUM* r = BN_bin2bn(sig.r, 32, nullptr);
    BIGNUM* s = BN_bin2bn(sig.s, 32, nullptr);
    if (r == nullptr || s == nullptr || ECDSA_SIG_set0(ecsig, r, s) != 1) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(ecsig);
        return false;
    }

    // ecsig owns r and s from here
    int len = i2d_ECDSA_SIG(ecsig, nullptr);
    if (len <= 0) {
        ECDSA_SIG_free(ecsig);
        return false;
    }
    std::vector<uint8_t> buf(static_cast<size_t>(len));
    unsigned char* p = buf.data();
    int written = i2d_ECDSA_SIG(ecsig, &p);
    ECDSA_SIG_free(ecsig);
    if (written != len) {
        return false;
    }
    der.swap(buf);
    return true;
}

} // namespace secp256k1
