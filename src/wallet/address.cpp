// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address.hpp"

#include "chainparams.hpp"
#include "core-hashes.hpp"

using namespace std;


string GeneratePrivateKey(CRandomSource& source)
{
    return RandomHex(chainParams.PRIVATE_KEY_SIZE, source);
}

string DerivePublicKey(const string& strPrivKey)
{
    return CoreHashes::SHA256Hex(strPrivKey, ENCODING_UTF8);
}

string DeriveAddress(const string& strPubKey)
{
    valtype vchHash = CoreHashes::SHA256Bytes(strPubKey, ENCODING_UTF8);
    return chainParams.ADDRESS_PREFIX + CoreHashes::RIPEMD160Hex(vchHash);
}

bool IsValidAddress(const string& strAddress)
{
    if (strAddress.size() != chainParams.ADDRESS_LENGTH)
    {
        return false;
    }
    return strAddress.compare(0, chainParams.ADDRESS_PREFIX.size(),
                              chainParams.ADDRESS_PREFIX) == 0;
}
