// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hmac-sha256.hpp"

#include <string.h>

const size_t CHMAC_SHA256::OUTPUT_SIZE;

CHMAC_SHA256::CHMAC_SHA256(const unsigned char* key, size_t keylen)
{
    unsigned char rkey[CSHA256::BLOCK_SIZE];
    if (keylen <= CSHA256::BLOCK_SIZE)
    {
        if (keylen > 0)
        {
            memcpy(rkey, key, keylen);
        }
        memset(rkey + keylen, 0, CSHA256::BLOCK_SIZE - keylen);
    }
    else
    {
        CSHA256().Write(key, keylen).Finalize(rkey);
        memset(rkey + CSHA256::OUTPUT_SIZE, 0,
               CSHA256::BLOCK_SIZE - CSHA256::OUTPUT_SIZE);
    }

    for (size_t n = 0; n < CSHA256::BLOCK_SIZE; n++)
    {
        rkey[n] ^= 0x5c;
    }
    outer.Write(rkey, CSHA256::BLOCK_SIZE);

    // 0x5c ^ 0x36 flips the opad key into the ipad key
    for (size_t n = 0; n < CSHA256::BLOCK_SIZE; n++)
    {
        rkey[n] ^= 0x5c ^ 0x36;
    }
    inner.Write(rkey, CSHA256::BLOCK_SIZE);
}

void CHMAC_SHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned char temp[CSHA256::OUTPUT_SIZE];
    inner.Finalize(temp);
    outer.Write(temp, CSHA256::OUTPUT_SIZE).Finalize(hash);
}
