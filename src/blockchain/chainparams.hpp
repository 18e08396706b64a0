// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINPARAMS_H
#define CHAINPARAMS_H

#include <stddef.h>
#include <stdint.h>

#include <string>

class ChainParams;

extern const ChainParams chainParams;

class ChainParams
{
public:

    ChainParams();

    //////////////////////////////////////////////////////////////////////////////
    // Addresses

    std::string ADDRESS_PREFIX;

    // prefix + hex of a 20 byte ripemd160 digest
    size_t ADDRESS_LENGTH;
    size_t ADDRESS_BODY_LENGTH;


    //////////////////////////////////////////////////////////////////////////////
    // Keys

    size_t PRIVATE_KEY_SIZE;

    size_t HMAC_BLOCK_SIZE;


    //////////////////////////////////////////////////////////////////////////////
    // Chain

    int DEFAULT_DIFFICULTY;

    int64_t MINING_REWARD;

    int64_t TOTAL_SUPPLY;


    //////////////////////////////////////////////////////////////////////////////
    //
    // Genesis block
    //

    std::string strGenesisPreviousHash;

    std::string strGenesisRecipient;


    //////////////////////////////////////////////////////////////////////////////
    // Client

    // miner threads, -1 means one per hardware thread
    int DEFAULT_GENPROCLIMIT;
};


// -difficulty, falling back to DEFAULT_DIFFICULTY for negative values
int GetDifficulty();

#endif  // CHAINPARAMS_H
