// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_ADDRESS_H
#define COSMO_ADDRESS_H

#include "random.hpp"

#include <string>

/******************************************************************************
 * Address derivation
 *
 *    privkey  = hex(32 random bytes)
 *    pubkey   = sha256hex(privkey as text)
 *    body     = ripemd160hex(sha256(pubkey as text))
 *    address  = "cosmo" + body
 *
 * Both hex strings fed to sha256 are hashed as text. Only the second
 *    digest goes into ripemd160 as raw bytes. Addresses carry no checksum,
 *    validity is the prefix and the length.
 ******************************************************************************/

// 64 lowercase hex characters
std::string GeneratePrivateKey(CRandomSource& source=GetDefaultRandomSource());

std::string DerivePublicKey(const std::string& strPrivKey);

std::string DeriveAddress(const std::string& strPubKey);

bool IsValidAddress(const std::string& strAddress);

#endif  // COSMO_ADDRESS_H
