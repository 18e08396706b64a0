// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "encoding.hpp"

#include "test-utils.hpp"


using namespace std;


class EncodingTest : public ::testing::Test
{
protected:
    void SetUp() override {}
};


int main(int argc, char **argv)
{

    set_debug(argc, argv);

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}


TEST_F(EncodingTest, BytesToHex)
{
    valtype vch = { 0x00, 0x01, 0x7f, 0x80, 0xab, 0xff };
    EXPECT_EQ(BytesToHex(vch), "00017f80abff");
    EXPECT_EQ(BytesToHex(vch.data(), 2), "0001");
    EXPECT_EQ(BytesToHex(valtype()), "");
}

TEST_F(EncodingTest, HexToBytes)
{
    valtype vchExpected = { 0xde, 0xad, 0xbe, 0xef };
    EXPECT_EQ(HexToBytes("deadbeef"), vchExpected);
    EXPECT_EQ(HexToBytes("DeAdBeEf"), vchExpected);
    EXPECT_TRUE(HexToBytes("").empty());

    print_info("Testing rejection of odd length and non-hex input.");
    EXPECT_THROW(HexToBytes("abc"), encoding_error);
    EXPECT_THROW(HexToBytes("0"), encoding_error);
    EXPECT_THROW(HexToBytes("zz"), encoding_error);
    EXPECT_THROW(HexToBytes("0g"), encoding_error);
    EXPECT_THROW(HexToBytes("00 1"), encoding_error);
    EXPECT_THROW(HexToBytes("0x00"), encoding_error);
}

TEST_F(EncodingTest, HexRoundTrip)
{
    for (size_t nLen = 0; nLen < 100; nLen += 9)
    {
        valtype vch;
        generateRandomData(nLen, vch);
        string strHex = BytesToHex(vch);
        ASSERT_EQ(strHex.size(), 2 * nLen);
        ASSERT_EQ(HexToBytes(strHex), vch);
    }

    print_info("Testing that decoding then encoding lowercases.");
    EXPECT_EQ(BytesToHex(HexToBytes("00AbCdEF")), "00abcdef");
}

TEST_F(EncodingTest, IsHex)
{
    EXPECT_TRUE(IsHex("00"));
    EXPECT_TRUE(IsHex("0123456789abcdefABCDEF"));
    EXPECT_FALSE(IsHex(""));
    EXPECT_FALSE(IsHex("abc"));
    EXPECT_FALSE(IsHex("gg"));
    EXPECT_EQ(HexDigit('a'), 10);
    EXPECT_EQ(HexDigit('F'), 15);
    EXPECT_EQ(HexDigit('x'), -1);
}

TEST_F(EncodingTest, InputEncodingNames)
{
    EXPECT_EQ(GetInputEncoding("hex"), ENCODING_HEX);
    EXPECT_EQ(GetInputEncoding("utf8"), ENCODING_UTF8);
    // anything else is read as text
    EXPECT_EQ(GetInputEncoding("base64"), ENCODING_UTF8);
    EXPECT_EQ(GetInputEncoding(""), ENCODING_UTF8);
    EXPECT_EQ(string(GetInputEncodingName(ENCODING_HEX)), "hex");
    EXPECT_EQ(string(GetInputEncodingName(ENCODING_UTF8)), "utf8");
}

TEST_F(EncodingTest, NormalizeInput)
{
    valtype vchBytes = { 0x01, 0x02, 0xff };

    print_info("Testing that bytes pass through unchanged.");
    EXPECT_EQ(NormalizeInput(vchBytes), vchBytes);
    EXPECT_EQ(NormalizeInput(vchBytes, ENCODING_HEX), vchBytes);
    EXPECT_EQ(CHashInput(vchBytes).GetType(), CHashInput::TYPE_BYTES);
    EXPECT_EQ(NormalizeInput(CHashInput(vchBytes.data(), 2)),
              valtype(vchBytes.begin(), vchBytes.begin() + 2));

    print_info("Testing strings as UTF-8 and as hex.");
    valtype vchText = { 'a', 'b', 'c' };
    EXPECT_EQ(NormalizeInput("abc"), vchText);
    EXPECT_EQ(NormalizeInput(string("abc"), ENCODING_UTF8), vchText);
    valtype vchUTF8 = { 0xc3, 0xa9 };
    EXPECT_EQ(NormalizeInput("\xc3\xa9"), vchUTF8);
    EXPECT_EQ(NormalizeInput("0102ff", ENCODING_HEX), vchBytes);
    EXPECT_EQ(CHashInput("abc").GetType(), CHashInput::TYPE_STRING);
    EXPECT_THROW(NormalizeInput("abc", ENCODING_HEX), encoding_error);

    print_info("Testing that an empty input is not a missing one.");
    EXPECT_TRUE(NormalizeInput("").empty());
    EXPECT_TRUE(NormalizeInput(valtype()).empty());

    print_info("Testing missing input.");
    const char* pszNull = NULL;
    EXPECT_TRUE(CHashInput(pszNull).IsNull());
    EXPECT_TRUE(CHashInput().IsNull());
    EXPECT_THROW(NormalizeInput(CHashInput()), input_type_error);
    EXPECT_THROW(NormalizeInput(pszNull, ENCODING_HEX), input_type_error);
}
