#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "fetchcache/util/hash.hh"

namespace fetchcache {

/* ----------------------------------------------------------------------------
 * hashString
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownMD5Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc1321
    auto s1 = "";
    auto hash = hashString(HashAlgorithm::MD5, s1);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "md5:d41d8cd98f00b204e9800998ecf8427e");
}

TEST(hashString, testKnownMD5Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc1321
    auto s2 = "abc";
    auto hash = hashString(HashAlgorithm::MD5, s2);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "md5:900150983cd24fb0d6963f7d28e17f72");
}

TEST(hashString, testKnownSHA1Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abc";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "sha1:a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(hashString, testKnownSHA1Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "sha1:84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST(hashString, testKnownSHA256Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";

    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(
        hash.to_string(HashFormat::Base16, true),
        "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hashString, testKnownSHA256Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(
        hash.to_string(HashFormat::Base16, true),
        "sha256:248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(hashString, testKnownSHA512Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";
    auto hash = hashString(HashAlgorithm::SHA512, s);
    ASSERT_EQ(
        hash.to_string(HashFormat::Base16, true),
        "sha512:ddaf35a193617abacc417349ae20413112e6fa4e89a9"
        "7ea20a9eeee64b55d39a2192992a274fc1a836ba3c23a3feebbd"
        "454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(hashString, base64)
{
    auto hash = hashString(HashAlgorithm::MD5, "");
    ASSERT_EQ(hash.to_string(HashFormat::Base64, false), "1B2M2Y8AsgTpgAmY7PhCfg==");
}

/* ----------------------------------------------------------------------------
 * HashSink
 * --------------------------------------------------------------------------*/

TEST(HashSink, emptyInput)
{
    HashSink sink(HashAlgorithm::MD5);
    auto [hash, numBytes] = sink.finish();
    ASSERT_EQ(numBytes, 0u);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, false), "d41d8cd98f00b204e9800998ecf8427e");
}

RC_GTEST_PROP(HashSink, chunkedInputMatchesHashString, (const std::string & s, unsigned int chunkSize))
{
    size_t step = chunkSize % 64 + 1;

    HashSink sink(HashAlgorithm::SHA256);
    for (size_t pos = 0; pos < s.size(); pos += step)
        sink(std::string_view(s).substr(pos, step));
    auto [hash, numBytes] = sink.finish();

    RC_ASSERT(numBytes == s.size());
    RC_ASSERT(hash == hashString(HashAlgorithm::SHA256, s));
}

/* ----------------------------------------------------------------------------
 * Hash::parseBase16
 * --------------------------------------------------------------------------*/

TEST(parseBase16, acceptsUppercase)
{
    auto hash = Hash::parseBase16("D41D8CD98F00B204E9800998ECF8427E", HashAlgorithm::MD5);
    ASSERT_EQ(hash, hashString(HashAlgorithm::MD5, ""));
}

TEST(parseBase16, rejectsWrongLength)
{
    ASSERT_THROW(Hash::parseBase16("d41d8cd98f00b204", HashAlgorithm::MD5), BadHash);
}

TEST(parseBase16, rejectsNonHexDigits)
{
    ASSERT_THROW(Hash::parseBase16("z41d8cd98f00b204e9800998ecf8427e", HashAlgorithm::MD5), BadHash);
}

/* ----------------------------------------------------------------------------
 * parseHashAlgo, printHashAlgo
 * --------------------------------------------------------------------------*/

TEST(parseHashAlgo, knownAlgorithms)
{
    for (auto & name : hashAlgorithms)
        ASSERT_EQ(printHashAlgo(parseHashAlgo(name)), name);
}

TEST(parseHashAlgo, unknownAlgorithm)
{
    ASSERT_FALSE(parseHashAlgoOpt("crc32").has_value());
    ASSERT_THROW(parseHashAlgo("crc32"), UsageError);
}

} // namespace fetchcache
