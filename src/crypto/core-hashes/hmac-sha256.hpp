// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_HMAC_SHA256_H
#define COSMO_HMAC_SHA256_H

#include "sha256.hpp"

#include <stddef.h>
#include <stdint.h>

/**
 * A hasher class for HMAC-SHA-256 (RFC 2104). Keys longer than the
 * 64 byte block are replaced by their SHA-256 digest, shorter keys are
 * zero padded to the block size.
 */
class CHMAC_SHA256
{
private:
    CSHA256 outer;
    CSHA256 inner;

public:
    static const size_t OUTPUT_SIZE = 32;

    CHMAC_SHA256(const unsigned char* key, size_t keylen);
    CHMAC_SHA256& Write(const unsigned char* data, size_t len)
    {
        inner.Write(data, len);
        return *this;
    }
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
};

#endif  // COSMO_HMAC_SHA256_H
