// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_SIGNER_H
#define COSMO_SIGNER_H

#include <string>


/**
 * Produces and checks message signatures for a single key holder.
 * Wallet keys and transactions only talk to this interface, so an
 * asymmetric scheme can replace CHmacSigner without touching callers.
 */
class CSigner
{
public:
    virtual ~CSigner() {}

    virtual std::string Sign(const std::string& strMessage) const = 0;

    virtual bool Verify(const std::string& strMessage,
                        const std::string& strSignature) const = 0;
};


/**
 * HMAC-SHA256 keyed by the UTF-8 bytes of the private key hex text.
 * The signature is the lowercase hex MAC. Anyone holding the private
 * key can reproduce it, so this only authorizes a single party.
 */
class CHmacSigner : public CSigner
{
private:
    std::string strKey;

public:
    explicit CHmacSigner(const std::string& strKeyIn) : strKey(strKeyIn) {}

    std::string Sign(const std::string& strMessage) const;

    // recomputes the MAC and compares in constant time
    bool Verify(const std::string& strMessage,
                const std::string& strSignature) const;
};

#endif  // COSMO_SIGNER_H
