// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <wallet/chains.h>
#include <util/strencodings.h>

#include <algorithm>
#include <stdexcept>

namespace {

const ChainInfo CHAIN_TABLE[] = {
    {Chain::ETH,     "ETH",     ChainFamily::EVM,     HDCurve::SECP256K1, "m/44'/60'/0'/0/0",         1},
    {Chain::BSC,     "BSC",     ChainFamily::EVM,     HDCurve::SECP256K1, "m/44'/60'/0'/0/0",         56},
    {Chain::POLYGON, "POLYGON", ChainFamily::EVM,     HDCurve::SECP256K1, "m/44'/60'/0'/0/0",         137},
    {Chain::BTC,     "BTC",     ChainFamily::BITCOIN, HDCurve::SECP256K1, "m/84'/0'/0'/0/0",          0},
    {Chain::SOL,     "SOL",     ChainFamily::SOLANA,  HDCurve::ED25519,   "m/44'/501'/0'/0'",         0},
    {Chain::TON,     "TON",     ChainFamily::TON,     HDCurve::ED25519,   "m/44'/607'/0'/0'/0'/0'",   0},
};

const size_t ACCOUNT_LEVEL = 2;

} // namespace

const ChainInfo& GetChainInfo(Chain chain) {
    for (const ChainInfo& info : CHAIN_TABLE) {
        if (info.chain == chain) {
            return info;
        }
    }
    throw std::out_of_range("GetChainInfo: unknown chain");
}

const std::vector<Chain>& AllChains() {
    static const std::vector<Chain> chains = [] {
        std::vector<Chain> v;
        for (const ChainInfo& info : CHAIN_TABLE) {
            v.push_back(info.chain);
        }
        std::sort(v.begin(), v.end(), [](Chain a, Chain b) {
            return std::string(GetChainInfo(a).name) < std::string(GetChainInfo(b).name);
        });
        return v;
    }();
    return chains;
}

std::string ChainToString(Chain chain) {
    return GetChainInfo(chain).name;
}

bool ParseChain(const std::string& name, Chain& chain) {
    std::string upper = TrimString(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>((c >= 'a' && c <= 'z') ? c - 'a' + 'A' : c);
    });
    for (const ChainInfo& info : CHAIN_TABLE) {
        if (upper == info.name) {
            chain = info.chain;
            return true;
        }
    }
    return false;
}

bool GetDerivationPath(Chain chain, uint32_t account_index, CHDKeyPath& path) {
    if (account_index >= HD_HARDENED_BIT) {
        return false;
    }
    CHDKeyPath parsed;
    if (!parsed.Parse(GetChainInfo(chain).path) || parsed.indices.size() <= ACCOUNT_LEVEL) {
        return false;
    }
    parsed.indices[ACCOUNT_LEVEL] = account_index | HD_HARDENED_BIT;
    path = parsed;
    return true;
}
