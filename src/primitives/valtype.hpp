// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef _VALTYPE_H_
#define _VALTYPE_H_ 1

#include <vector>


// ByteSequence: every digest, key and hash input is built as one of these
typedef std::vector<unsigned char> valtype;

#endif  /* _VALTYPE_H_ */
