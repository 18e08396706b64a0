// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef _COSMO_ENCODING_H_
#define _COSMO_ENCODING_H_ 1

#include "valtype.hpp"

#include <stdexcept>
#include <string>


// malformed hex: odd length or a character outside 0-9a-fA-F
class encoding_error : public std::runtime_error
{
public:
    explicit encoding_error(const std::string& str) : std::runtime_error(str) {}
};

// hash input that is neither a byte sequence nor a string
class input_type_error : public std::runtime_error
{
public:
    explicit input_type_error(const std::string& str) : std::runtime_error(str) {}
};


enum InputEncoding
{
    ENCODING_UTF8,
    ENCODING_HEX
};

// "hex" selects ENCODING_HEX, every other name is treated as text
InputEncoding GetInputEncoding(const std::string& strName);

const char* GetInputEncodingName(InputEncoding encoding);


template<typename T>
std::string HexStr(const T itbegin, const T itend)
{
    static const char hexmap[16] = { '0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    std::string rv;
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it)
    {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

std::string BytesToHex(const valtype& vch);

std::string BytesToHex(const unsigned char* pch, size_t nSize);

// throws encoding_error, never truncates or pads
valtype HexToBytes(const std::string& strHex);

// true if str is non-empty, of even length, and only hex digits
bool IsHex(const std::string& str);

// returns -1 if c is not a hex digit
signed char HexDigit(char c);


/**
 * A value handed to a digest: either raw bytes or a string that is
 * interpreted according to an InputEncoding when it is normalized.
 * A default constructed input (or one made from a NULL C string) holds
 * no value and fails normalization with input_type_error.
 */
class CHashInput
{
public:
    enum Type
    {
        TYPE_NONE,
        TYPE_BYTES,
        TYPE_STRING
    };

    CHashInput();
    CHashInput(const valtype& vchIn);
    CHashInput(const unsigned char* pch, size_t nSize);
    CHashInput(const std::string& strIn);
    CHashInput(const char* psz);

    Type GetType() const { return type; }
    bool IsNull() const { return type == TYPE_NONE; }

    valtype Normalize(InputEncoding encoding=ENCODING_UTF8) const;

private:
    Type type;
    valtype vch;
    std::string str;
};

valtype NormalizeInput(const CHashInput& input,
                       InputEncoding encoding=ENCODING_UTF8);

#endif  /* _COSMO_ENCODING_H_ */
