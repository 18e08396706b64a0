// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_TRANSACTION_H
#define COSMO_TRANSACTION_H

#include "random.hpp"
#include "signer.hpp"
#include "walletkey.hpp"

#include <boost/optional.hpp>

#include <stdint.h>

#include <stdexcept>
#include <string>
#include <vector>


class tx_error : public std::runtime_error
{
public:
    explicit tx_error(const std::string& str) : std::runtime_error(str) {}
};


enum TxType
{
    TX_TRANSFER,
    TX_MINT,
    TX_MINE,
    TX_BURN
};

const char* GetTxTypeName(TxType type);

// false if strName is not one of transfer, mint, mine, burn
bool ParseTxType(const std::string& strName, TxType& typeRet);


// ECMAScript Number::toString: shortest round-trip digits, non-finite is null
std::string FormatJSONNumber(double d);

// quoted and escaped the way JSON.stringify escapes strings
std::string JSONQuote(const std::string& str);


/**
 * A ledger transaction. Absent addresses (mint and mining rewards
 * have no sender) and a missing signature render as null.
 */
class CTransaction
{
public:
    std::string strId;
    boost::optional<std::string> fromAddress;
    boost::optional<std::string> toAddress;
    double dAmount;
    TxType type;
    // milliseconds since the epoch
    int64_t nTime;
    boost::optional<std::string> signature;

    CTransaction()
    {
        SetNull();
    }

    // fresh transaction: random v4 id, current time, unsigned
    CTransaction(const boost::optional<std::string>& fromAddressIn,
                 const boost::optional<std::string>& toAddressIn,
                 double dAmountIn,
                 TxType typeIn=TX_TRANSFER,
                 CRandomSource& source=GetDefaultRandomSource());

    void SetNull();

    // no sender, or a mint or mining reward
    bool IsSystem() const;

    // sha256 hex of from + to + amount + time + type
    std::string GetHash() const;

    // signs with the key and the address derived from it, throws tx_error
    //    if the key does not own the fromAddress of a transfer
    void Sign(const CWalletKey& key);

    // for signers without a wallet key, strSignerAddress must be the
    //    address of the key behind signer
    void Sign(const CSigner& signer, const std::string& strSignerAddress);

    bool VerifySignature(const CSigner& signer) const;

    // canonical object, fields in order id, fromAddress, toAddress,
    //    amount, type, timestamp, signature
    std::string ToJSON() const;

    std::string ToString() const;
};


std::string TransactionsToJSON(const std::vector<CTransaction>& vtx);

#endif  // COSMO_TRANSACTION_H
