// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "encoding.hpp"

#include "util.h"

using namespace std;


InputEncoding GetInputEncoding(const string& strName)
{
    if (strName == "hex")
    {
        return ENCODING_HEX;
    }
    return ENCODING_UTF8;
}

const char* GetInputEncodingName(InputEncoding encoding)
{
    switch (encoding)
    {
    case ENCODING_UTF8: return "utf8";
    case ENCODING_HEX: return "hex";
    }
    return NULL;
}

string BytesToHex(const valtype& vch)
{
    return HexStr(vch.begin(), vch.end());
}

string BytesToHex(const unsigned char* pch, size_t nSize)
{
    return HexStr(pch, pch + nSize);
}

signed char HexDigit(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

bool IsHex(const string& str)
{
    for (string::const_iterator it = str.begin(); it != str.end(); ++it)
    {
        if (HexDigit(*it) < 0)
        {
            return false;
        }
    }
    return (str.size() > 0) && (str.size() % 2 == 0);
}

valtype HexToBytes(const string& strHex)
{
    if (strHex.size() % 2 != 0)
    {
        throw encoding_error(
                strprintf("HexToBytes(): odd length hex string (%" PRIszu ")",
                          strHex.size()));
    }

    valtype vch;
    vch.reserve(strHex.size() / 2);
    for (size_t i = 0; i < strHex.size(); i += 2)
    {
        signed char hi = HexDigit(strHex[i]);
        signed char lo = HexDigit(strHex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            throw encoding_error(
                    strprintf("HexToBytes(): non-hex character at offset %" PRIszu,
                              (hi < 0) ? i : i + 1));
        }
        vch.push_back((unsigned char)((hi << 4) | lo));
    }

    return vch;
}


CHashInput::CHashInput()
    : type(TYPE_NONE) {}

CHashInput::CHashInput(const valtype& vchIn)
    : type(TYPE_BYTES),
      vch(vchIn) {}

CHashInput::CHashInput(const unsigned char* pch, size_t nSize)
    : type(TYPE_BYTES),
      vch(pch, pch + nSize) {}

CHashInput::CHashInput(const string& strIn)
    : type(TYPE_STRING),
      str(strIn) {}

CHashInput::CHashInput(const char* psz)
    : type(psz ? TYPE_STRING : TYPE_NONE)
{
    if (psz)
    {
        str = psz;
    }
}

valtype CHashInput::Normalize(InputEncoding encoding) const
{
    switch (type)
    {
    case TYPE_BYTES:
        // bytes are taken as they are, whatever the encoding
        return vch;
    case TYPE_STRING:
        if (encoding == ENCODING_HEX)
        {
            return HexToBytes(str);
        }
        // std::string already holds the UTF-8 code units
        return valtype(str.begin(), str.end());
    case TYPE_NONE:
        break;
    }
    throw input_type_error("NormalizeInput(): unsupported data type for "
                           "crypto operation");
}

valtype NormalizeInput(const CHashInput& input, InputEncoding encoding)
{
    return input.Normalize(encoding);
}
