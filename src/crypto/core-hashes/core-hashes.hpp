////////////////////////////////////////////////////////////////////////////////
// core-hashes.hpp
//
// Copyright (c) 2024 The Cosmo Developers
//
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
////////////////////////////////////////////////////////////////////////////////

/******************************************************************************
 * The intent of core-hashes is to provide a standard interface for the
 *    digests sha256 and ripemd160, and for hmac-sha256, implemented here
 *    from the standards and requiring no external dependencies.
 *
 * Raw interface parameters:
 *    `pdata` : pointer to data
 *    `nbytes` : length of data at `pdata`
 *    `pdigest` : pointer to digest, which must have room for the digest
 *
 * Raw interface returns:
 *    size of the digest in bytes
 *
 * The value interface takes a CHashInput (bytes, or a string read as
 *    UTF-8 text or as hex according to an InputEncoding) and returns the
 *    digest as bytes or as lowercase hex.
 ******************************************************************************/

#pragma once

#include "encoding.hpp"
#include "hmac-sha256.hpp"
#include "ripemd160.hpp"
#include "sha256.hpp"

#include <stddef.h>

#define SHA256_DIGEST_LENGTH_ 32
#define SHA256_BLOCK_LENGTH_ 64
#define RIPEMD160_DIGEST_LENGTH_ 20
#define RIPEMD160_BLOCK_LENGTH_ 64

namespace CoreHashes
{


unsigned int SHA256(const unsigned char* pdata,
                    unsigned int nbytes,
                    unsigned char* pdigest);

unsigned int RIPEMD160(const unsigned char* pdata,
                       unsigned int nbytes,
                       unsigned char* pdigest);

unsigned int HMAC_SHA256(const unsigned char* pkey,
                         unsigned int nkeybytes,
                         const unsigned char* pdata,
                         unsigned int nbytes,
                         unsigned char* pdigest);


valtype SHA256Bytes(const CHashInput& data,
                    InputEncoding encoding=ENCODING_UTF8);

std::string SHA256Hex(const CHashInput& data,
                      InputEncoding encoding=ENCODING_UTF8);

valtype RIPEMD160Bytes(const CHashInput& data,
                       InputEncoding encoding=ENCODING_UTF8);

std::string RIPEMD160Hex(const CHashInput& data,
                         InputEncoding encoding=ENCODING_UTF8);

valtype HMACSHA256Bytes(const CHashInput& key,
                        const CHashInput& message,
                        InputEncoding keyEncoding=ENCODING_UTF8,
                        InputEncoding messageEncoding=ENCODING_UTF8);

std::string HMACSHA256Hex(const CHashInput& key,
                          const CHashInput& message,
                          InputEncoding keyEncoding=ENCODING_UTF8,
                          InputEncoding messageEncoding=ENCODING_UTF8);

}  // namespace CoreHashes
