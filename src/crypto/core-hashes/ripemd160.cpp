// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ripemd160.hpp"

#include "common.h"

#include <string.h>

const size_t CRIPEMD160::OUTPUT_SIZE;
const size_t CRIPEMD160::BLOCK_SIZE;

// Internal implementation code.
namespace
{
namespace ripemd160
{

// message word selection, left line
static const unsigned char R[80] = {
     0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15,
     7,  4, 13,  1, 10,  6, 15,  3, 12,  0,  9,  5,  2, 14, 11,  8,
     3, 10, 14,  4,  9, 15,  8,  1,  2,  7,  0,  6, 13, 11,  5, 12,
     1,  9, 11, 10,  0,  8, 12,  4, 13,  3,  7, 15, 14,  5,  6,  2,
     4,  0,  5,  9,  7, 12,  2, 10, 14,  1,  3,  8, 11,  6, 15, 13
};

// message word selection, right line
static const unsigned char RP[80] = {
     5, 14,  7,  0,  9,  2, 11,  4, 13,  6, 15,  8,  1, 10,  3, 12,
     6, 11,  3,  7,  0, 13,  5, 10, 14, 15,  8, 12,  4,  9,  1,  2,
    15,  5,  1,  3,  7, 14,  6,  9, 11,  8, 12,  2, 10,  0,  4, 13,
     8,  6,  4,  1,  3, 11, 15,  0,  5, 12,  2, 13,  9,  7, 10, 14,
    12, 15, 10,  4,  1,  5,  8,  7,  6,  2, 13, 14,  0,  3,  9, 11
};

// rotate amounts, left line
static const unsigned char S[80] = {
    11, 14, 15, 12,  5,  8,  7,  9, 11, 13, 14, 15,  6,  7,  9,  8,
     7,  6,  8, 13, 11,  9,  7, 15,  7, 12, 15,  9, 11,  7, 13, 12,
    11, 13,  6,  7, 14,  9, 13, 15, 14,  8, 13,  6,  5, 12,  7,  5,
    11, 12, 14, 15, 14, 15,  9,  8,  9, 14,  5,  6,  8,  6,  5, 12,
     9, 15,  5, 11,  6,  8, 13, 12,  5, 12, 13, 14, 11,  8,  5,  6
};

// rotate amounts, right line
static const unsigned char SP[80] = {
     8,  9,  9, 11, 13, 15, 15,  5,  7,  7,  8, 11, 14, 14, 12,  6,
     9, 13, 15,  7, 12,  8,  9, 11,  7,  7, 12,  7,  6, 15, 13, 11,
     9,  7, 15, 11,  8,  6,  6, 14, 12, 13,  5, 14, 13, 13,  7,  5,
    15,  5,  8, 11, 14, 14,  6, 14,  6,  9, 12,  9, 12,  5, 15,  8,
     8,  5, 12,  9, 12,  5, 14,  6,  8, 13,  6,  5, 15, 13, 11, 11
};

// one constant per round of 16 steps
static const uint32_t K[5] = {
    0x00000000ul, 0x5a827999ul, 0x6ed9eba1ul, 0x8f1bbcdcul, 0xa953fd4eul
};

static const uint32_t KP[5] = {
    0x50a28be6ul, 0x5c4dd124ul, 0x6d703ef3ul, 0x7a6d76e9ul, 0x00000000ul
};

inline uint32_t rol(uint32_t x, int i) { return (x << i) | (x >> (32 - i)); }

// nonlinear function for step j (0..79)
inline uint32_t f(int j, uint32_t x, uint32_t y, uint32_t z)
{
    if (j < 16)
    {
        return x ^ y ^ z;
    }
    if (j < 32)
    {
        return (x & y) | (~x & z);
    }
    if (j < 48)
    {
        return (x | ~y) ^ z;
    }
    if (j < 64)
    {
        return (x & z) | (y & ~z);
    }
    return x ^ (y | ~z);
}

/** Initialize RIPEMD-160 state. */
inline void Initialize(uint32_t* s)
{
    s[0] = 0x67452301ul;
    s[1] = 0xefcdab89ul;
    s[2] = 0x98badcfeul;
    s[3] = 0x10325476ul;
    s[4] = 0xc3d2e1f0ul;
}

/** Perform a RIPEMD-160 transformation, processing a 64-byte chunk. */
void Transform(uint32_t* s, const unsigned char* chunk)
{
    uint32_t w[16];
    for (int i = 0; i < 16; ++i)
    {
        w[i] = ReadLE32(chunk + i * 4);
    }

    uint32_t al = s[0], bl = s[1], cl = s[2], dl = s[3], el = s[4];
    uint32_t ar = s[0], br = s[1], cr = s[2], dr = s[3], er = s[4];

    for (int j = 0; j < 80; ++j)
    {
        uint32_t t = rol(al + f(j, bl, cl, dl) + w[R[j]] + K[j / 16], S[j]) + el;
        al = el;
        el = dl;
        dl = rol(cl, 10);
        cl = bl;
        bl = t;

        // the right line runs the nonlinear functions in reverse order
        t = rol(ar + f(79 - j, br, cr, dr) + w[RP[j]] + KP[j / 16], SP[j]) + er;
        ar = er;
        er = dr;
        dr = rol(cr, 10);
        cr = br;
        br = t;
    }

    uint32_t t = s[1] + cl + dr;
    s[1] = s[2] + dl + er;
    s[2] = s[3] + el + ar;
    s[3] = s[4] + al + br;
    s[4] = s[0] + bl + cr;
    s[0] = t;
}

}  // namespace ripemd160
}  // namespace


CRIPEMD160::CRIPEMD160() : bytes(0)
{
    ripemd160::Initialize(s);
}

CRIPEMD160& CRIPEMD160::Write(const unsigned char* data, size_t len)
{
    const unsigned char* end = data + len;
    size_t bufsize = bytes % 64;
    if (bufsize && bufsize + len >= 64)
    {
        // Fill the buffer, and process it.
        memcpy(buf + bufsize, data, 64 - bufsize);
        bytes += 64 - bufsize;
        data += 64 - bufsize;
        ripemd160::Transform(s, buf);
        bufsize = 0;
    }
    while (end - data >= 64)
    {
        // Process full chunks directly from the source.
        ripemd160::Transform(s, data);
        bytes += 64;
        data += 64;
    }
    if (end > data)
    {
        // Fill the buffer with what remains.
        memcpy(buf + bufsize, data, end - data);
        bytes += end - data;
    }
    return *this;
}

void CRIPEMD160::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    // same padding as SHA-256, but the bit length is little endian
    static const unsigned char pad[64] = {0x80};
    unsigned char sizedesc[8];
    WriteLE64(sizedesc, bytes << 3);
    Write(pad, 1 + ((119 - (bytes % 64)) % 64));
    Write(sizedesc, 8);
    for (int i = 0; i < 5; ++i)
    {
        WriteLE32(hash + i * 4, s[i]);
    }
}

CRIPEMD160& CRIPEMD160::Reset()
{
    bytes = 0;
    ripemd160::Initialize(s);
    return *this;
}
