// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.hpp"

#include "encoding.hpp"
#include "util.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <limits.h>

using namespace std;


void COpenSSLRandomSource::GetBytes(unsigned char* pch, size_t nSize)
{
    if (nSize == 0)
    {
        return;
    }
    if (RAND_status() != 1)
    {
        throw rng_error("COpenSSLRandomSource::GetBytes(): "
                        "OpenSSL random generator is not seeded");
    }
    // RAND_bytes takes an int count
    while (nSize > 0)
    {
        int nChunk = (nSize > (size_t)INT_MAX) ? INT_MAX : (int)nSize;
        if (RAND_bytes(pch, nChunk) != 1)
        {
            throw rng_error(
                    strprintf("COpenSSLRandomSource::GetBytes(): "
                              "RAND_bytes failed, error %lu",
                              ERR_get_error()));
        }
        pch += nChunk;
        nSize -= nChunk;
    }
}


CRandomSource& GetDefaultRandomSource()
{
    static COpenSSLRandomSource source;
    return source;
}

valtype RandomBytes(size_t nSize, CRandomSource& source)
{
    valtype vch(nSize);
    if (nSize > 0)
    {
        source.GetBytes(vch.data(), nSize);
    }
    return vch;
}

string RandomHex(size_t nSize, CRandomSource& source)
{
    return BytesToHex(RandomBytes(nSize, source));
}

string MakeUUID(CRandomSource& source)
{
    boost::uuids::uuid uuid;
    source.GetBytes(uuid.begin(), uuid.size());

    // version 4
    uuid.data[6] = (uuid.data[6] & 0x0f) | 0x40;
    // variant 10xx
    uuid.data[8] = (uuid.data[8] & 0x3f) | 0x80;

    return boost::uuids::to_string(uuid);
}
