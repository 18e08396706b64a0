// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.hpp"

#include "util.h"

using namespace std;


ChainParams::ChainParams()
{
    //////////////////////////////////////////////////////////////////////////////
    //
    // Addresses
    //

    ADDRESS_PREFIX = "cosmo";
    ADDRESS_BODY_LENGTH = 40;
    ADDRESS_LENGTH = 45;


    //////////////////////////////////////////////////////////////////////////////
    //
    // Keys
    //

    PRIVATE_KEY_SIZE = 32;
    HMAC_BLOCK_SIZE = 64;


    //////////////////////////////////////////////////////////////////////////////
    //
    // Chain
    //

    // leading hex zeros required of a block hash
    DEFAULT_DIFFICULTY = 2;
    MINING_REWARD = 100;
    TOTAL_SUPPLY = 1000000;


    //////////////////////////////////////////////////////////////////////////////
    //
    // Genesis block
    //

    strGenesisPreviousHash = "0";
    strGenesisRecipient = "genesis";


    //////////////////////////////////////////////////////////////////////////////
    //
    // Client
    //

    DEFAULT_GENPROCLIMIT = -1;
}

int GetDifficulty()
{
    int64_t nDifficulty = GetArg("-difficulty",
                                 (int64_t)chainParams.DEFAULT_DIFFICULTY);
    if (nDifficulty < 0)
    {
        LogPrintf("GetDifficulty(): negative -difficulty=%" PRId64
                  ", using %d\n",
                  nDifficulty, chainParams.DEFAULT_DIFFICULTY);
        return chainParams.DEFAULT_DIFFICULTY;
    }
    // a hash has 64 hex characters
    if (nDifficulty > 64)
    {
        LogPrintf("GetDifficulty(): -difficulty=%" PRId64
                  " exceeds the hash length, using 64\n",
                  nDifficulty);
        return 64;
    }
    return (int)nDifficulty;
}

const ChainParams chainParams;
