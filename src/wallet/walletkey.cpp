// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "walletkey.hpp"

#include "address.hpp"
#include "chainparams.hpp"
#include "encoding.hpp"

using namespace std;


void CWalletKey::MakeNewKey(CRandomSource& source)
{
    string strNewKey = GeneratePrivateKey(source);
    strPubKey = DerivePublicKey(strNewKey);
    strAddress = DeriveAddress(strPubKey);
    strPrivKey = strNewKey;
}

void CWalletKey::SetPrivateKey(const string& strPrivKeyIn)
{
    if ((strPrivKeyIn.size() != 2 * chainParams.PRIVATE_KEY_SIZE) ||
        !IsHex(strPrivKeyIn))
    {
        throw key_error("Invalid private key format");
    }
    strPrivKey = strPrivKeyIn;
    strPubKey = DerivePublicKey(strPrivKey);
    strAddress = DeriveAddress(strPubKey);
}

CHmacSigner CWalletKey::GetSigner() const
{
    if (IsNull())
    {
        throw key_error("CWalletKey::GetSigner(): key is not set");
    }
    return CHmacSigner(strPrivKey);
}

string CWalletKey::Sign(const string& strMessage) const
{
    return GetSigner().Sign(strMessage);
}

bool CWalletKey::Verify(const string& strMessage,
                        const string& strSignature) const
{
    return GetSigner().Verify(strMessage, strSignature);
}

bool CWalletKey::IsValidAddress(const string& strAddressIn)
{
    return ::IsValidAddress(strAddressIn);
}
