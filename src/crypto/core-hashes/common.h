// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_CRYPTO_COMMON_H
#define COSMO_CRYPTO_COMMON_H

#include <stdint.h>

// Byte order helpers for the digest engines. They work a byte at a time
// so the result does not depend on the host's endianness.

static inline uint32_t ReadLE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0]) |
           ((uint32_t)ptr[1] << 8) |
           ((uint32_t)ptr[2] << 16) |
           ((uint32_t)ptr[3] << 24);
}

static inline uint32_t ReadBE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0] << 24) |
           ((uint32_t)ptr[1] << 16) |
           ((uint32_t)ptr[2] << 8) |
           ((uint32_t)ptr[3]);
}

static inline void WriteLE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x & 0xff;
    ptr[1] = (x >> 8) & 0xff;
    ptr[2] = (x >> 16) & 0xff;
    ptr[3] = (x >> 24) & 0xff;
}

static inline void WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = (x >> 24) & 0xff;
    ptr[1] = (x >> 16) & 0xff;
    ptr[2] = (x >> 8) & 0xff;
    ptr[3] = x & 0xff;
}

static inline void WriteLE64(unsigned char* ptr, uint64_t x)
{
    WriteLE32(ptr, (uint32_t)x);
    WriteLE32(ptr + 4, (uint32_t)(x >> 32));
}

static inline void WriteBE64(unsigned char* ptr, uint64_t x)
{
    WriteBE32(ptr, (uint32_t)(x >> 32));
    WriteBE32(ptr + 4, (uint32_t)x);
}

#endif  // COSMO_CRYPTO_COMMON_H
