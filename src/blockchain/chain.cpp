// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain.hpp"

#include "chainparams.hpp"
#include "util.h"

using namespace std;


CBlock CreateGenesisBlock(int64_t nTime, CRandomSource& source)
{
    vector<CTransaction> vtx;
    vtx.push_back(CTransaction(boost::none,
                               chainParams.strGenesisRecipient,
                               (double)chainParams.TOTAL_SUPPLY,
                               TX_MINT,
                               source));
    return CBlock(nTime, vtx, chainParams.strGenesisPreviousHash);
}

bool CheckChain(const vector<CBlock>& vblock, int nMinDifficulty)
{
    for (unsigned int i = 1; i < vblock.size(); i++)
    {
        const CBlock& block = vblock[i];
        const CBlock& blockPrev = vblock[i - 1];

        if (!block.CheckBlock())
        {
            return error("CheckChain() : block %u fails its hash", i);
        }
        if (block.strPrevHash != blockPrev.strHash)
        {
            return error("CheckChain() : block %u does not link to block %u",
                         i, i - 1);
        }
        if (!CheckProofOfWork(block.strHash, nMinDifficulty))
        {
            return error("CheckChain() : block %u hash %s misses difficulty %d",
                         i, block.strHash.c_str(), nMinDifficulty);
        }
    }
    return true;
}
