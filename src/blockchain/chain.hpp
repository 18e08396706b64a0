// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_CHAIN_H
#define COSMO_CHAIN_H

#include "block.hpp"

#include <vector>


// one mint of the total supply to the genesis recipient, not mined
CBlock CreateGenesisBlock(int64_t nTime,
                          CRandomSource& source=GetDefaultRandomSource());

/**
 * Validates every block after the genesis block: its stored hash must
 * equal the recomputed hash and link to the hash of the block before it.
 * Blocks do not record the difficulty they were mined at, so proof of
 * work is only checked when the caller names a minimum (nMinDifficulty
 * above 0). Returns false (logging the reason) on the first block that
 * fails.
 */
bool CheckChain(const std::vector<CBlock>& vblock, int nMinDifficulty=0);

#endif  // COSMO_CHAIN_H
