// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"

const std::string CLIENT_NAME("Cosmo");

std::string FormatFullVersion()
{
    return CLIENT_NAME + " " + V_CLIENT_VERSION_FULL_STR;
}
