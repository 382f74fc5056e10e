#include "crypto/util/hash.hpp"
#include "crypto/Digest.hpp"
#include "error/Error.hpp"
#include "TestTree.hpp"

#include <gtest/gtest.h>

using namespace fm;
using namespace fm::crypto;
using namespace fm::test;

TEST(DigestTest, HexRoundTripsAndRejectsGarbage) {
    Digest256 d;
    for (size_t i = 0; i < Digest256::SIZE; ++i) d.bytes[i] = static_cast<uint8_t>(i * 7);

    const auto hex = d.hex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(Digest256::fromHex(hex), d);

    EXPECT_FALSE(Digest256::fromHex("abc"));
    EXPECT_FALSE(Digest256::fromHex(std::string(64, 'z')));
}

TEST(DigestTest, EmptyFileHasKnownBlake2bDigest) {
    const TestTree tree;
    tree.write("empty", "");
    EXPECT_EQ(hash::blake2b(tree.path("empty"), 1024).hex(),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST(DigestTest, DigestDoesNotDependOnChunkSize) {
    const TestTree tree;
    std::string content;
    for (int i = 0; i < 10000; ++i) content += static_cast<char>('a' + i % 26);
    tree.write("f", content);

    const auto reference = hash::blake2b(tree.path("f"), 1 << 20);
    for (const size_t chunk : {1u, 7u, 64u, 4096u, 9999u, 10000u, 10001u})
        EXPECT_EQ(hash::blake2b(tree.path("f"), chunk), reference) << "chunk " << chunk;

    hash::Blake2b incremental;
    incremental.update(content.data(), 3);
    incremental.update(content.data() + 3, content.size() - 3);
    EXPECT_EQ(incremental.finish(), reference);
}

TEST(DigestTest, DifferentContentDiffers) {
    const TestTree tree;
    tree.write("a", "hello");
    tree.write("b", "hellp");
    EXPECT_NE(hash::blake2b(tree.path("a"), 4), hash::blake2b(tree.path("b"), 4));
}

TEST(DigestTest, MissingFileIsNotFound) {
    const TestTree tree;
    EXPECT_THROW(hash::blake2b(tree.path("nope"), 16), error::NotFoundError);
}

TEST(DigestTest, RaisedInterruptStopsHashing) {
    const TestTree tree;
    tree.write("f", std::string(1000, 'x'));
    const std::atomic<bool> interrupt{true};
    EXPECT_THROW(hash::blake2b(tree.path("f"), 10, &interrupt), error::Interrupted);
}
