// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signer.hpp"

#include "core-hashes.hpp"

#include <openssl/crypto.h>

using namespace std;


string CHmacSigner::Sign(const string& strMessage) const
{
    return CoreHashes::HMACSHA256Hex(strKey, strMessage);
}

bool CHmacSigner::Verify(const string& strMessage,
                         const string& strSignature) const
{
    string strExpected = Sign(strMessage);
    if (strSignature.size() != strExpected.size())
    {
        return false;
    }
    return CRYPTO_memcmp(strSignature.data(),
                         strExpected.data(),
                         strExpected.size()) == 0;
}
