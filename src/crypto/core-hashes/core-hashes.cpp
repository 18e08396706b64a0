////////////////////////////////////////////////////////////////////////////////
// core-hashes.cpp
//
// Copyright (c) 2024 The Cosmo Developers
//
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
////////////////////////////////////////////////////////////////////////////////

#include "core-hashes.hpp"

#include <stdexcept>

using namespace std;

unsigned int CoreHashes::SHA256(const unsigned char* pdata,
                                unsigned int nbytes,
                                unsigned char* pdigest)
{
    if (pdigest == nullptr)
    {
        throw runtime_error(
                   "CoreHashes::SHA256(): "
                   "Pointer to 32 byte digest array is NULL.");
    }

    CSHA256().Write(pdata, nbytes).Finalize(pdigest);

    return SHA256_DIGEST_LENGTH_;
}

unsigned int CoreHashes::RIPEMD160(const unsigned char* pdata,
                                   unsigned int nbytes,
                                   unsigned char* pdigest)
{
    if (pdigest == nullptr)
    {
        throw runtime_error(
                   "CoreHashes::RIPEMD160(): "
                   "Pointer to 20 byte digest array is NULL.");
    }

    CRIPEMD160().Write(pdata, nbytes).Finalize(pdigest);

    return RIPEMD160_DIGEST_LENGTH_;
}

unsigned int CoreHashes::HMAC_SHA256(const unsigned char* pkey,
                                     unsigned int nkeybytes,
                                     const unsigned char* pdata,
                                     unsigned int nbytes,
                                     unsigned char* pdigest)
{
    if (pdigest == nullptr)
    {
        throw runtime_error(
                   "CoreHashes::HMAC_SHA256(): "
                   "Pointer to 32 byte digest array is NULL.");
    }

    CHMAC_SHA256(pkey, nkeybytes).Write(pdata, nbytes).Finalize(pdigest);

    return SHA256_DIGEST_LENGTH_;
}


valtype CoreHashes::SHA256Bytes(const CHashInput& data,
                                InputEncoding encoding)
{
    valtype vchMessage = NormalizeInput(data, encoding);
    valtype vchDigest(SHA256_DIGEST_LENGTH_);
    CSHA256().Write(vchMessage.data(), vchMessage.size())
             .Finalize(vchDigest.data());
    return vchDigest;
}

string CoreHashes::SHA256Hex(const CHashInput& data,
                             InputEncoding encoding)
{
    return BytesToHex(SHA256Bytes(data, encoding));
}

valtype CoreHashes::RIPEMD160Bytes(const CHashInput& data,
                                   InputEncoding encoding)
{
    valtype vchMessage = NormalizeInput(data, encoding);
    valtype vchDigest(RIPEMD160_DIGEST_LENGTH_);
    CRIPEMD160().Write(vchMessage.data(), vchMessage.size())
                .Finalize(vchDigest.data());
    return vchDigest;
}

string CoreHashes::RIPEMD160Hex(const CHashInput& data,
                                InputEncoding encoding)
{
    return BytesToHex(RIPEMD160Bytes(data, encoding));
}

valtype CoreHashes::HMACSHA256Bytes(const CHashInput& key,
                                    const CHashInput& message,
                                    InputEncoding keyEncoding,
                                    InputEncoding messageEncoding)
{
    valtype vchKey = NormalizeInput(key, keyEncoding);
    valtype vchMessage = NormalizeInput(message, messageEncoding);
    valtype vchDigest(SHA256_DIGEST_LENGTH_);
    CHMAC_SHA256(vchKey.data(), vchKey.size())
                .Write(vchMessage.data(), vchMessage.size())
                .Finalize(vchDigest.data());
    return vchDigest;
}

string CoreHashes::HMACSHA256Hex(const CHashInput& key,
                                 const CHashInput& message,
                                 InputEncoding keyEncoding,
                                 InputEncoding messageEncoding)
{
    return BytesToHex(HMACSHA256Bytes(key, message,
                                      keyEncoding, messageEncoding));
}
