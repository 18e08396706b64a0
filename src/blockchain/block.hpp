// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_BLOCK_H
#define COSMO_BLOCK_H

#include "sha256.hpp"
#include "transaction.hpp"

#include <stdint.h>

#include <string>
#include <vector>


// true if the first nDifficulty hex characters of strHash are '0'
bool CheckProofOfWork(const std::string& strHash, int nDifficulty);


/**
 * A block of the ledger. Its hash is the sha256 hex of the canonical
 * serialization
 *
 *     previousHash + timestamp + JSON(transactions) + nonce
 *
 * with timestamp and nonce in decimal. Only the nonce (and with it the
 * hash) changes while mining.
 */
class CBlock
{
public:
    std::string strPrevHash;
    // milliseconds since the epoch
    int64_t nTime;
    std::vector<CTransaction> vtx;
    uint64_t nNonce;
    std::string strHash;

    CBlock()
    {
        SetNull();
    }

    // nonce 0, hash computed from the payload
    CBlock(int64_t nTimeIn,
           const std::vector<CTransaction>& vtxIn,
           const std::string& strPrevHashIn);

    void SetNull();

    std::string GetSerialization() const;

    std::string CalculateHash() const;

    // sha256 state after everything that precedes the nonce
    CSHA256 GetPrefixHasher() const;

    // single threaded search from nonce 0, see CMiner for the parallel one
    void MineBlock(int nDifficulty);

    // stored hash equals the recomputed hash
    bool CheckBlock() const;

    std::string ToString() const;
};


// hash of a block whose serialization prefix went into hasherPrefix
std::string CalculateHashWithNonce(const CSHA256& hasherPrefix,
                                   uint64_t nNonce);

#endif  // COSMO_BLOCK_H
