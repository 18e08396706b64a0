// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_MINER_H
#define COSMO_MINER_H

#include "block.hpp"

#include <boost/thread/mutex.hpp>

#include <stdint.h>

#include <atomic>
#include <exception>


/**
 * Parallel proof-of-work search. Worker i of N tries the nonces
 * i, i+N, i+2N, ... and publishes a hit by lowering a shared best nonce.
 * A worker quits once its next nonce is not below the best, so the
 * search always ends on the smallest qualifying nonce, the same one
 * CBlock::MineBlock finds.
 */
class CMiner
{
private:
    static const uint64_t NO_NONCE = UINT64_MAX;

    int nThreads;

    std::atomic<bool> fStop;
    std::atomic<bool> fRunning;
    std::atomic<uint64_t> nBestNonce;
    std::atomic<uint64_t> nHashCount;

    // meter and first worker failure
    mutable boost::mutex mutexMiner;
    double dHashesPerSec;
    int64_t nHPSTimerStart;
    uint64_t nHPSCounter;
    std::exception_ptr pexFirst;

    void Search(const CSHA256* phasherPrefix, int nDifficulty, int nWorker);
    void UpdateHashMeter(uint64_t nHashes);

public:
    // nThreadsIn <= 0 takes the count from -genproclimit
    explicit CMiner(int nThreadsIn=0);
    ~CMiner();

    // hardware threads, capped by -genproclimit when that is positive
    static int GetDefaultThreadCount();

    /**
     * Binds the smallest nonce (from 0) whose hash meets nDifficulty into
     * block, along with its hash. Returns false, leaving block untouched,
     * if Stop() was called during the search or since the previous one
     * ended. A failure inside a worker stops the other workers and is
     * rethrown here.
     */
    bool MineBlock(CBlock& block, int nDifficulty);

    // cooperative, workers finish the hash at hand. Called while idle it
    //    cancels the next search.
    void Stop();

    bool IsRunning() const
    {
        return fRunning;
    }

    int GetThreadCount() const
    {
        return nThreads;
    }

    double GetHashesPerSec() const;

    // hashes computed over the lifetime of this miner
    uint64_t GetHashCount() const
    {
        return nHashCount;
    }
};

#endif  // COSMO_MINER_H
