// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include "core-hashes.hpp"
#include "util.h"

#include <cmath>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace std;


static const char* const TX_TYPE_NAMES[] = { "transfer", "mint", "mine", "burn" };

const char* GetTxTypeName(TxType type)
{
    switch (type)
    {
    case TX_TRANSFER:
    case TX_MINT:
    case TX_MINE:
    case TX_BURN:
        return TX_TYPE_NAMES[type];
    }
    return "unknown";
}

bool ParseTxType(const string& strName, TxType& typeRet)
{
    for (int i = TX_TRANSFER; i <= TX_BURN; ++i)
    {
        if (strName == TX_TYPE_NAMES[i])
        {
            typeRet = (TxType)i;
            return true;
        }
    }
    return false;
}


string FormatJSONNumber(double d)
{
    if (!std::isfinite(d))
    {
        return "null";
    }
    // also catches negative zero
    if (d == 0)
    {
        return "0";
    }

    string strSign;
    if (d < 0)
    {
        strSign = "-";
        d = -d;
    }

    // fewest significant digits that read back as the same double,
    //    17 always do
    char buf[32];
    for (int nDigits = 1; nDigits <= 17; ++nDigits)
    {
        snprintf(buf, sizeof(buf), "%.*e", nDigits - 1, d);
        if (strtod(buf, NULL) == d)
        {
            break;
        }
    }

    // buf is "d[.ddd]e[+-]xx"
    const char* pszExp = strchr(buf, 'e');
    string strDigits;
    for (const char* p = buf; p < pszExp; ++p)
    {
        if (*p != '.')
        {
            strDigits.push_back(*p);
        }
    }
    while (strDigits.size() > 1 && strDigits[strDigits.size() - 1] == '0')
    {
        strDigits.erase(strDigits.size() - 1);
    }

    // value is 0.digits * 10^n
    int k = (int)strDigits.size();
    int n = atoi(pszExp + 1) + 1;

    string str;
    if (k <= n && n <= 21)
    {
        str = strDigits + string(n - k, '0');
    }
    else if (0 < n && n <= 21)
    {
        str = strDigits.substr(0, n) + "." + strDigits.substr(n);
    }
    else if (-6 < n && n <= 0)
    {
        str = "0." + string(-n, '0') + strDigits;
    }
    else
    {
        int e = n - 1;
        str = strDigits.substr(0, 1);
        if (k > 1)
        {
            str += "." + strDigits.substr(1);
        }
        str += strprintf("e%c%d", (e < 0) ? '-' : '+', (e < 0) ? -e : e);
    }

    return strSign + str;
}

string JSONQuote(const string& str)
{
    string strRet;
    strRet.reserve(str.size() + 2);
    strRet.push_back('"');
    for (string::const_iterator it = str.begin(); it != str.end(); ++it)
    {
        unsigned char c = (unsigned char)(*it);
        switch (c)
        {
        case '"':
            strRet += "\\\"";
            break;
        case '\\':
            strRet += "\\\\";
            break;
        case '\b':
            strRet += "\\b";
            break;
        case '\f':
            strRet += "\\f";
            break;
        case '\n':
            strRet += "\\n";
            break;
        case '\r':
            strRet += "\\r";
            break;
        case '\t':
            strRet += "\\t";
            break;
        default:
            if (c < 0x20)
            {
                strRet += strprintf("\\u%04x", (unsigned int)c);
            }
            else
            {
                strRet.push_back((char)c);
            }
        }
    }
    strRet.push_back('"');
    return strRet;
}


// string interpolation of a value, as opposed to its JSON rendering
static string NumberToString(double d)
{
    if (std::isnan(d))
    {
        return "NaN";
    }
    if (std::isinf(d))
    {
        return (d < 0) ? "-Infinity" : "Infinity";
    }
    return FormatJSONNumber(d);
}

static string OptionalToString(const boost::optional<string>& str)
{
    return str ? *str : string("null");
}

static string OptionalToJSON(const boost::optional<string>& str)
{
    return str ? JSONQuote(*str) : string("null");
}


CTransaction::CTransaction(const boost::optional<string>& fromAddressIn,
                           const boost::optional<string>& toAddressIn,
                           double dAmountIn,
                           TxType typeIn,
                           CRandomSource& source)
{
    SetNull();
    strId = MakeUUID(source);
    fromAddress = fromAddressIn;
    toAddress = toAddressIn;
    dAmount = dAmountIn;
    type = typeIn;
    nTime = GetTimeMillis();
}

void CTransaction::SetNull()
{
    strId.clear();
    fromAddress = boost::none;
    toAddress = boost::none;
    dAmount = 0;
    type = TX_TRANSFER;
    nTime = 0;
    signature = boost::none;
}

bool CTransaction::IsSystem() const
{
    return !fromAddress || (type == TX_MINT) || (type == TX_MINE);
}

string CTransaction::GetHash() const
{
    string strPayload = OptionalToString(fromAddress) +
                        OptionalToString(toAddress) +
                        NumberToString(dAmount) +
                        i64tostr(nTime) +
                        GetTxTypeName(type);
    return CoreHashes::SHA256Hex(strPayload);
}

void CTransaction::Sign(const CWalletKey& key)
{
    Sign(key.GetSigner(), key.GetAddress());
}

void CTransaction::Sign(const CSigner& signer, const string& strSignerAddress)
{
    if ((type == TX_TRANSFER) &&
        (!fromAddress || (*fromAddress != strSignerAddress)))
    {
        throw tx_error("You cannot sign transactions for other wallets!");
    }
    signature = signer.Sign(GetHash());
}

bool CTransaction::VerifySignature(const CSigner& signer) const
{
    if (!signature)
    {
        return error("CTransaction::VerifySignature(): %s is not signed",
                     strId.c_str());
    }
    return signer.Verify(GetHash(), *signature);
}

string CTransaction::ToJSON() const
{
    string str = "{";
    str += "\"id\":" + JSONQuote(strId);
    str += ",\"fromAddress\":" + OptionalToJSON(fromAddress);
    str += ",\"toAddress\":" + OptionalToJSON(toAddress);
    str += ",\"amount\":" + FormatJSONNumber(dAmount);
    str += ",\"type\":" + JSONQuote(GetTxTypeName(type));
    str += ",\"timestamp\":" + i64tostr(nTime);
    str += ",\"signature\":" + OptionalToJSON(signature);
    str += "}";
    return str;
}

string CTransaction::ToString() const
{
    return strprintf("CTransaction(id=%s, type=%s, from=%s, to=%s, "
                     "amount=%s, time=%" PRId64 ", signed=%s)",
                     strId.c_str(),
                     GetTxTypeName(type),
                     OptionalToString(fromAddress).c_str(),
                     OptionalToString(toAddress).c_str(),
                     NumberToString(dAmount).c_str(),
                     nTime,
                     signature ? "yes" : "no");
}


string TransactionsToJSON(const vector<CTransaction>& vtx)
{
    string str = "[";
    for (vector<CTransaction>::const_iterator it = vtx.begin();
         it != vtx.end(); ++it)
    {
        if (it != vtx.begin())
        {
            str += ",";
        }
        str += it->ToJSON();
    }
    str += "]";
    return str;
}
