// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef _COSMO_RANDOM_H_
#define _COSMO_RANDOM_H_ 1

#include "valtype.hpp"

#include <stddef.h>

#include <stdexcept>
#include <string>


// no cryptographically secure source could be reached
class rng_error : public std::runtime_error
{
public:
    explicit rng_error(const std::string& str) : std::runtime_error(str) {}
};


/**
 * Source of random bytes handed explicitly to everything that needs
 * randomness (key generation, transaction ids). Implementations must be
 * safe to call from several threads at once.
 */
class CRandomSource
{
public:
    virtual ~CRandomSource() {}

    // fills pch with nSize random bytes or throws rng_error
    virtual void GetBytes(unsigned char* pch, size_t nSize) = 0;
};


// Backed by OpenSSL's CSPRNG, never falls back to a weaker generator.
class COpenSSLRandomSource : public CRandomSource
{
public:
    void GetBytes(unsigned char* pch, size_t nSize);
};


// process-wide OpenSSL source
CRandomSource& GetDefaultRandomSource();

valtype RandomBytes(size_t nSize,
                    CRandomSource& source=GetDefaultRandomSource());

// nSize random bytes as 2*nSize lowercase hex characters
std::string RandomHex(size_t nSize,
                      CRandomSource& source=GetDefaultRandomSource());

// RFC 4122 version 4 UUID, e.g. "1b4e28ba-2fa1-41d2-883f-0016d3cca427"
std::string MakeUUID(CRandomSource& source=GetDefaultRandomSource());

#endif  /* _COSMO_RANDOM_H_ */
