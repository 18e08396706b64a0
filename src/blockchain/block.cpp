// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "block.hpp"

#include "encoding.hpp"
#include "util.h"

#include <stdio.h>

using namespace std;


bool CheckProofOfWork(const string& strHash, int nDifficulty)
{
    if (nDifficulty <= 0)
    {
        return true;
    }
    if (strHash.size() < (size_t)nDifficulty)
    {
        return false;
    }
    for (int i = 0; i < nDifficulty; ++i)
    {
        if (strHash[i] != '0')
        {
            return false;
        }
    }
    return true;
}

string CalculateHashWithNonce(const CSHA256& hasherPrefix, uint64_t nNonce)
{
    char pszNonce[24];
    int nLen = snprintf(pszNonce, sizeof(pszNonce), "%" PRIu64, nNonce);
    unsigned char hash[CSHA256::OUTPUT_SIZE];
    CSHA256 hasher(hasherPrefix);
    hasher.Write((const unsigned char*)pszNonce, nLen).Finalize(hash);
    return HexStr(hash, hash + CSHA256::OUTPUT_SIZE);
}


CBlock::CBlock(int64_t nTimeIn,
               const vector<CTransaction>& vtxIn,
               const string& strPrevHashIn)
{
    SetNull();
    strPrevHash = strPrevHashIn;
    nTime = nTimeIn;
    vtx = vtxIn;
    strHash = CalculateHash();
}

void CBlock::SetNull()
{
    strPrevHash.clear();
    nTime = 0;
    vtx.clear();
    nNonce = 0;
    strHash.clear();
}

string CBlock::GetSerialization() const
{
    return strPrevHash +
           i64tostr(nTime) +
           TransactionsToJSON(vtx) +
           strprintf("%" PRIu64, nNonce);
}

CSHA256 CBlock::GetPrefixHasher() const
{
    string strPrefix = strPrevHash + i64tostr(nTime) + TransactionsToJSON(vtx);
    CSHA256 hasher;
    hasher.Write((const unsigned char*)strPrefix.data(), strPrefix.size());
    return hasher;
}

string CBlock::CalculateHash() const
{
    return CalculateHashWithNonce(GetPrefixHasher(), nNonce);
}

void CBlock::MineBlock(int nDifficulty)
{
    CSHA256 hasherPrefix = GetPrefixHasher();

    nNonce = 0;
    strHash = CalculateHashWithNonce(hasherPrefix, nNonce);
    while (!CheckProofOfWork(strHash, nDifficulty))
    {
        ++nNonce;
        strHash = CalculateHashWithNonce(hasherPrefix, nNonce);
    }

    LogPrintf("Block mined: %s\n", strHash.c_str());
}

bool CBlock::CheckBlock() const
{
    string strExpected = CalculateHash();
    if (strHash != strExpected)
    {
        return error("CheckBlock() : hash mismatch, stored %s, computed %s",
                     strHash.c_str(), strExpected.c_str());
    }
    return true;
}

string CBlock::ToString() const
{
    string str = strprintf("CBlock(hash=%s, prev=%s, nTime=%" PRId64
                           ", nNonce=%" PRIu64 ", vtx=%" PRIszu ")\n",
                           strHash.c_str(),
                           strPrevHash.c_str(),
                           nTime,
                           nNonce,
                           vtx.size());
    for (unsigned int i = 0; i < vtx.size(); i++)
    {
        str += "  " + vtx[i].ToString() + "\n";
    }
    return str;
}
