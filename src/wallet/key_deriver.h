// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_KEY_DERIVER_H
#define POLYVAULT_WALLET_KEY_DERIVER_H

#include <wallet/chains.h>
#include <wallet/crypter.h>
#include <wallet/wallet_errors.h>

#include <stdint.h>
#include <string>
#include <vector>

/**
 * CKeyDeriver
 *
 * Per-curve derivation capability. The seed is the 64-byte BIP-39 seed;
 * account_index replaces the account level (third component) of the
 * chain's fixed path.
 *
 * Public key encodings:
 *   EVM      65-byte uncompressed SEC1
 *   BTC      33-byte compressed SEC1
 *   SOL/TON  32-byte ed25519
 */
class CKeyDeriver {
public:
    virtual ~CKeyDeriver() {}

    virtual HDCurve GetCurve() const = 0;

    virtual WalletError DerivePrivateKey(const CKeyingMaterial& seed, Chain chain,
                                         uint32_t account_index,
                                         CKeyingMaterial& private_key) const;

    virtual WalletError DerivePublicKey(const CKeyingMaterial& private_key, Chain chain,
                                        std::vector<uint8_t>& public_key) const = 0;

    virtual WalletError DeriveAddress(const std::vector<uint8_t>& public_key, Chain chain,
                                      std::string& address) const = 0;
};

class CSecp256k1Deriver : public CKeyDeriver {
public:
    HDCurve GetCurve() const override { return HDCurve::SECP256K1; }

    WalletError DerivePublicKey(const CKeyingMaterial& private_key, Chain chain,
                                std::vector<uint8_t>& public_key) const override;

    WalletError DeriveAddress(const std::vector<uint8_t>& public_key, Chain chain,
                              std::string& address) const override;
};

class CEd25519Deriver : public CKeyDeriver {
public:
    HDCurve GetCurve() const override { return HDCurve::ED25519; }

    WalletError DerivePublicKey(const CKeyingMaterial& private_key, Chain chain,
                                std::vector<uint8_t>& public_key) const override;

    WalletError DeriveAddress(const std::vector<uint8_t>& public_key, Chain chain,
                              std::string& address) const override;
};

/**
 * Deriver for a chain's curve (static instances)
 */
const CKeyDeriver& GetKeyDeriver(Chain chain);

/**
 * Public view of one chain account, as stored in a wallet record
 */
struct CChainAccount {
    std::string address;
    std::string public_key;   // hex
    std::string path;
};

/**
 * Derive the private key, public key and address for a chain in one pass
 *
 * The private key never leaves this call.
 */
WalletError DeriveChainAccount(const CKeyingMaterial& seed, Chain chain, uint32_t account_index,
                               CChainAccount& account);

#endif // POLYVAULT_WALLET_KEY_DERIVER_H
