// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "miner.hpp"

#include "chainparams.hpp"
#include "util.h"

#include <boost/bind/bind.hpp>
#include <boost/thread.hpp>

#include <stdexcept>

using namespace std;

const uint64_t CMiner::NO_NONCE;

// hashes a worker computes between meter updates
static const uint64_t METER_BATCH = 1024;


CMiner::CMiner(int nThreadsIn)
    : fStop(false),
      fRunning(false),
      nBestNonce(NO_NONCE),
      nHashCount(0),
      dHashesPerSec(0),
      nHPSTimerStart(0),
      nHPSCounter(0)
{
    nThreads = (nThreadsIn > 0) ? nThreadsIn : GetDefaultThreadCount();
}

CMiner::~CMiner()
{
    Stop();
}

int CMiner::GetDefaultThreadCount()
{
    int64_t nLimitProcessors = GetArg("-genproclimit",
                                      (int64_t)chainParams.DEFAULT_GENPROCLIMIT);
    int nProcessors = boost::thread::hardware_concurrency();
    if (nProcessors < 1)
    {
        nProcessors = 1;
    }
    if ((nLimitProcessors > 0) && (nProcessors > nLimitProcessors))
    {
        nProcessors = (int)nLimitProcessors;
    }
    return nProcessors;
}

void CMiner::Stop()
{
    fStop = true;
}

double CMiner::GetHashesPerSec() const
{
    boost::mutex::scoped_lock lock(mutexMiner);
    return dHashesPerSec;
}

void CMiner::UpdateHashMeter(uint64_t nHashes)
{
    nHashCount += nHashes;

    boost::mutex::scoped_lock lock(mutexMiner);
    nHPSCounter += nHashes;
    int64_t nNow = GetTimeMillis();
    if (nNow - nHPSTimerStart > 4000)
    {
        dHashesPerSec = 1000.0 * nHPSCounter / (nNow - nHPSTimerStart);
        nHPSTimerStart = nNow;
        nHPSCounter = 0;
        if (fDebugMining)
        {
            LogPrintf("hashmeter %3d CPUs %6.0f khash/s\n",
                      nThreads, dHashesPerSec / 1000.0);
        }
    }
}

void CMiner::Search(const CSHA256* phasherPrefix, int nDifficulty, int nWorker)
{
    RenameThread("cosmo-miner");

    if (fDebugMining)
    {
        LogPrintf("CMiner worker %d started\n", nWorker);
    }

    try
    {
        const uint64_t nStride = nThreads;
        uint64_t nHashes = 0;
        for (uint64_t nNonce = nWorker; !fStop; nNonce += nStride)
        {
            if (nNonce >= nBestNonce)
            {
                break;
            }

            string strHash = CalculateHashWithNonce(*phasherPrefix, nNonce);

            if (++nHashes == METER_BATCH)
            {
                UpdateHashMeter(nHashes);
                nHashes = 0;
            }

            if (CheckProofOfWork(strHash, nDifficulty))
            {
                uint64_t nBest = nBestNonce;
                while ((nNonce < nBest) &&
                       !nBestNonce.compare_exchange_weak(nBest, nNonce))
                {
                }
                break;
            }

            if (nNonce > NO_NONCE - nStride)
            {
                throw runtime_error("CMiner::Search(): nonce space exhausted");
            }
        }
        UpdateHashMeter(nHashes);
    }
    catch (exception& e)
    {
        PrintException(&e, "CMiner::Search()");
        fStop = true;
        boost::mutex::scoped_lock lock(mutexMiner);
        if (!pexFirst)
        {
            pexFirst = current_exception();
        }
    }

    if (fDebugMining)
    {
        LogPrintf("CMiner worker %d exiting\n", nWorker);
    }
}

bool CMiner::MineBlock(CBlock& block, int nDifficulty)
{
    if (fRunning.exchange(true))
    {
        throw runtime_error("CMiner::MineBlock(): a search is already running");
    }

    // a Stop() that came in before this point still applies
    nBestNonce = NO_NONCE;
    {
        boost::mutex::scoped_lock lock(mutexMiner);
        pexFirst = exception_ptr();
        nHPSTimerStart = GetTimeMillis();
        nHPSCounter = 0;
        dHashesPerSec = 0;
    }

    const CSHA256 hasherPrefix = block.GetPrefixHasher();
    uint64_t nHashesStart = nHashCount;
    int64_t nStart = GetTimeMillis();

    LogPrintf("CMiner: searching with %d threads at difficulty %d\n",
              nThreads, nDifficulty);

    {
        boost::thread_group threadGroup;
        try
        {
            for (int i = 0; i < nThreads; i++)
            {
                threadGroup.create_thread(boost::bind(&CMiner::Search, this,
                                                      &hasherPrefix,
                                                      nDifficulty, i));
            }
        }
        catch (...)
        {
            // let the workers already started see the failure
            fStop = true;
            threadGroup.join_all();
            fStop = false;
            fRunning = false;
            throw;
        }
        threadGroup.join_all();
    }

    int64_t nElapsed = GetTimeMillis() - nStart;
    {
        boost::mutex::scoped_lock lock(mutexMiner);
        if ((dHashesPerSec == 0) && (nElapsed > 0))
        {
            dHashesPerSec = 1000.0 * (nHashCount - nHashesStart) / nElapsed;
        }
    }

    exception_ptr pex;
    {
        boost::mutex::scoped_lock lock(mutexMiner);
        pex = pexFirst;
    }
    // consumes the request, a hit found alongside it may not be the smallest
    bool fStopped = fStop.exchange(false);
    fRunning = false;

    if (pex)
    {
        rethrow_exception(pex);
    }

    uint64_t nNonce = nBestNonce;
    if (fStopped || (nNonce == NO_NONCE))
    {
        LogPrintf("CMiner: search stopped after %" PRId64 " ms\n", nElapsed);
        return false;
    }

    block.nNonce = nNonce;
    block.strHash = CalculateHashWithNonce(hasherPrefix, nNonce);

    LogPrintf("Block mined: %s\n", block.strHash.c_str());
    return true;
}
