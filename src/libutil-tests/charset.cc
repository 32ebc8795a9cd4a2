#include <gtest/gtest.h>

#include "fetchcache/util/charset.hh"

namespace fetchcache {

/* ----------------------------------------------------------------------------
 * getCharsetParam
 * --------------------------------------------------------------------------*/

TEST(getCharsetParam, noParameters)
{
    ASSERT_FALSE(getCharsetParam("application/json").has_value());
    ASSERT_FALSE(getCharsetParam("").has_value());
}

TEST(getCharsetParam, plain)
{
    ASSERT_EQ(getCharsetParam("text/plain; charset=utf-8"), "utf-8");
}

TEST(getCharsetParam, quotedAndCaseInsensitive)
{
    ASSERT_EQ(getCharsetParam("text/plain;CharSet=\"ISO-8859-1\""), "ISO-8859-1");
}

TEST(getCharsetParam, otherParametersFirst)
{
    ASSERT_EQ(getCharsetParam("text/html; format=flowed; charset=windows-1252"), "windows-1252");
}

TEST(getCharsetParam, emptyValue)
{
    ASSERT_FALSE(getCharsetParam("text/plain; charset=\"\"").has_value());
}

/* ----------------------------------------------------------------------------
 * decodeToUtf8
 * --------------------------------------------------------------------------*/

TEST(decodeToUtf8, latin1)
{
    ASSERT_EQ(decodeToUtf8("caf\xe9", "ISO-8859-1"), "caf\xc3\xa9");
}

TEST(decodeToUtf8, utf16)
{
    ASSERT_EQ(decodeToUtf8(std::string_view("h\0i\0", 4), "UTF-16LE"), "hi");
}

TEST(decodeToUtf8, emptyInput)
{
    ASSERT_EQ(decodeToUtf8("", "ISO-8859-1"), "");
}

TEST(decodeToUtf8, growsOutputBuffer)
{
    /* Every byte becomes two in UTF-8. */
    std::string input(1000, '\xe9');
    auto output = decodeToUtf8(input, "ISO-8859-1");

    ASSERT_EQ(output.size(), 2000u);
}

TEST(decodeToUtf8, flushesBufferedCharacter)
{
    /* The CP1255 converter holds back a Hebrew letter in case a
       combining point follows; it is only written out when the
       converter is flushed. */
    ASSERT_EQ(decodeToUtf8("\xe0", "CP1255"), "\xd7\x90");
}

TEST(decodeToUtf8, statefulEncoding)
{
    ASSERT_EQ(decodeToUtf8("\x1b$B\x30\x21\x1b(B", "ISO-2022-JP"), "\xe4\xba\x9c");
}

TEST(decodeToUtf8, unknownCharset)
{
    ASSERT_THROW(decodeToUtf8("abc", "no-such-charset"), UnknownCharset);
}

/* ----------------------------------------------------------------------------
 * checkUtf8
 * --------------------------------------------------------------------------*/

TEST(checkUtf8, valid)
{
    ASSERT_EQ(checkUtf8("gr\xc3\xbc\xc3\x9f"), "gr\xc3\xbc\xc3\x9f");
}

TEST(checkUtf8, invalidSequence)
{
    ASSERT_THROW(checkUtf8("bad \xff byte"), DecodeError);
}

TEST(checkUtf8, truncatedSequence)
{
    ASSERT_THROW(checkUtf8("cut \xc3"), DecodeError);
}

/* ----------------------------------------------------------------------------
 * latin1ToUtf8, utf8ToLatin1
 * --------------------------------------------------------------------------*/

TEST(latin1ToUtf8, everyByte)
{
    std::string all;
    for (int c = 0; c < 256; ++c)
        all.push_back((char) c);

    auto utf8 = latin1ToUtf8(all);
    ASSERT_EQ(utf8.size(), 128u + 2 * 128u);
    ASSERT_EQ(utf8ToLatin1(utf8), all);
}

TEST(utf8ToLatin1, outOfRange)
{
    ASSERT_EQ(utf8ToLatin1("caf\xc3\xa9"), "caf\xe9");
    ASSERT_THROW(utf8ToLatin1("\xe2\x82\xac"), DecodeError);
    ASSERT_THROW(utf8ToLatin1("bad \xff byte"), DecodeError);
}

} // namespace fetchcache
