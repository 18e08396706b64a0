// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_WALLETKEY_H
#define COSMO_WALLETKEY_H

#include "random.hpp"
#include "signer.hpp"

#include <stdexcept>
#include <string>


class key_error : public std::runtime_error
{
public:
    explicit key_error(const std::string& str) : std::runtime_error(str) {}
};


/**
 * A wallet key: the private key hex with the public key and address
 * derived from it. The public key and address are never set directly,
 * so they always match the private key.
 */
class CWalletKey
{
private:
    std::string strPrivKey;
    std::string strPubKey;
    std::string strAddress;

public:
    CWalletKey() {}

    void MakeNewKey(CRandomSource& source=GetDefaultRandomSource());

    // import: 64 hex characters, re-derives public key and address
    void SetPrivateKey(const std::string& strPrivKeyIn);

    bool IsNull() const
    {
        return strPrivKey.empty();
    }

    const std::string& GetPrivateKey() const
    {
        return strPrivKey;
    }

    const std::string& GetPublicKey() const
    {
        return strPubKey;
    }

    const std::string& GetAddress() const
    {
        return strAddress;
    }

    CHmacSigner GetSigner() const;

    std::string Sign(const std::string& strMessage) const;
    bool Verify(const std::string& strMessage,
                const std::string& strSignature) const;

    static bool IsValidAddress(const std::string& strAddressIn);
};

#endif  // COSMO_WALLETKEY_H
