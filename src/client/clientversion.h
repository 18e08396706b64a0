// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CLIENTVERSION_H
#define CLIENTVERSION_H

#include <string>

//
// client versioning
//

#define CLIENT_VERSION_MAJOR       1
#define CLIENT_VERSION_MINOR       0
#define CLIENT_VERSION_REVISION    0
#define CLIENT_VERSION_BUILD       0

// version   notes
// -------   ------------------------------------------------------------------
// 1.0.0.0 : Parallel miner, HMAC signer interface, seeded random sources
// 0.9.0.0 : [Genesis] sha256, ripemd160, hmac-sha256 without OpenSSL digests


// Converts the parameter X to a string after macro replacement on X has been performed.
// Don't merge these into one macro!
#define STRINGIZE(X) DO_STRINGIZE(X)
#define DO_STRINGIZE(X) #X


#define CLIENT_VERSION_FULL_STR STRINGIZE(CLIENT_VERSION_MAJOR) "." \
                                STRINGIZE(CLIENT_VERSION_MINOR) "." \
                                STRINGIZE(CLIENT_VERSION_REVISION) "." \
                                STRINGIZE(CLIENT_VERSION_BUILD)
#define V_CLIENT_VERSION_FULL_STR "v" CLIENT_VERSION_FULL_STR

static const int CLIENT_VERSION =
                           1000000 * CLIENT_VERSION_MAJOR
                         +   10000 * CLIENT_VERSION_MINOR
                         +     100 * CLIENT_VERSION_REVISION
                         +       1 * CLIENT_VERSION_BUILD;

extern const std::string CLIENT_NAME;

// e.g. "Cosmo v1.0.0.0"
std::string FormatFullVersion();

#endif // CLIENTVERSION_H
