// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_WALLET_SIGNER_H
#define POLYVAULT_WALLET_SIGNER_H

#include <wallet/chains.h>
#include <wallet/crypter.h>
#include <wallet/wallet_errors.h>

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Transaction parameters handed to a chain signer
 *
 * EVM chains use to/value/nonce/gas_price/gas_limit/chain_id/data.
 * BTC, SOL and TON sign the opaque payload.
 */
struct TxParams {
    std::string to;                 // "0x" + 40 hex, empty for contract creation
    std::string value;              // decimal wei amount, empty means 0
    uint64_t nonce;
    uint64_t gas_price;
    uint64_t gas_limit;
    uint64_t chain_id;              // 0 selects the chain's default id
    std::vector<uint8_t> data;
    std::vector<uint8_t> payload;

    TxParams() : nonce(0), gas_price(0), gas_limit(0), chain_id(0) {}
};

/**
 * CChainSigner - signs for one chain family with a derived private key
 */
class CChainSigner {
public:
    virtual ~CChainSigner() {}

    /**
     * @param chain Target chain (must belong to this signer's family)
     * @param private_key 32-byte chain private key
     * @param tx Parameters
     * @param signed_bytes Output
     * @param error Detail on INVALID_ARGUMENT
     */
    virtual WalletError Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                             std::vector<uint8_t>& signed_bytes, std::string& error) const = 0;
};

/**
 * Legacy EIP-155 transaction signer for ETH, BSC and POLYGON
 *
 * Output is the RLP list [nonce, gasPrice, gasLimit, to, value, data, v, r, s]
 * with v = chainId * 2 + 35 + recovery id.
 */
class CEvmSigner : public CChainSigner {
public:
    WalletError Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                     std::vector<uint8_t>& signed_bytes, std::string& error) const override;

    /**
     * Keccak-256 of RLP [nonce, gasPrice, gasLimit, to, value, data, chainId, 0, 0]
     */
    static bool SigningHash(Chain chain, const TxParams& tx, uint8_t hash[32],
                            uint64_t& chain_id, std::string& error);
};

/**
 * Bitcoin signer: DER-encoded low-S ECDSA over a precomputed 32-byte sighash
 */
class CBitcoinSigner : public CChainSigner {
public:
    WalletError Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                     std::vector<uint8_t>& signed_bytes, std::string& error) const override;
};

/**
 * Solana and TON signer: 64-byte Ed25519 signature over the serialized message
 */
class CEd25519Signer : public CChainSigner {
public:
    WalletError Sign(Chain chain, const CKeyingMaterial& private_key, const TxParams& tx,
                     std::vector<uint8_t>& signed_bytes, std::string& error) const override;
};

/**
 * Parse a non-negative decimal integer into minimal big-endian bytes
 *
 * @return false on an empty string, non-digits, or a value above 2^256 - 1
 */
bool ParseDecimalAmount(const std::string& value, std::vector<uint8_t>& out);

#endif // POLYVAULT_WALLET_SIGNER_H
