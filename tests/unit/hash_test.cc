#include <gtest/gtest.h>
#include "crypto/hash.hh"

using namespace rsec;

// ============================================================================
// SHA3-256 Tests
// ============================================================================

TEST(SHA3Test, EmptyInput) {
    auto hash = sha3_256(std::span<const std::uint8_t>{});
    EXPECT_EQ(bytes_to_hex(hash),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, KnownVector) {
    std::vector<std::uint8_t> input = {'a', 'b', 'c'};
    auto hash = sha3_256(input);
    EXPECT_EQ(bytes_to_hex(hash),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, DifferentInputsDifferentHashes) {
    std::vector<std::uint8_t> input1 = {1, 2, 3};
    std::vector<std::uint8_t> input2 = {1, 2, 4};
    EXPECT_NE(sha3_256(input1), sha3_256(input2));
}

// ============================================================================
// SHA3Hasher Tests
// ============================================================================

TEST(SHA3HasherTest, IncrementalHashing) {
    std::vector<std::uint8_t> input = {1, 2, 3, 4, 5, 6};

    auto direct_hash = sha3_256(input);

    SHA3Hasher hasher;
    hasher.update(std::span<const std::uint8_t>(input.data(), 3));
    hasher.update(input.data() + 3, 3);
    auto incremental_hash = hasher.finalize();

    EXPECT_EQ(direct_hash, incremental_hash);
}

TEST(SHA3HasherTest, Reset) {
    std::vector<std::uint8_t> input = {1, 2, 3};

    SHA3Hasher hasher;
    hasher.update(input);
    auto hash1 = hasher.finalize();

    hasher.reset();
    hasher.update(input);
    auto hash2 = hasher.finalize();

    EXPECT_EQ(hash1, hash2);
}

TEST(SHA3HasherTest, MoveTransfersContext) {
    std::vector<std::uint8_t> input = {9, 8, 7};

    SHA3Hasher first;
    first.update(input);
    SHA3Hasher second(std::move(first));

    EXPECT_EQ(second.finalize(), sha3_256(input));
}

// ============================================================================
// Merkle Tree Tests
// ============================================================================

TEST(MerkleTreeTest, SingleLeaf) {
    hash_t leaf{};
    leaf[0] = 0x42;

    MerkleTree tree({leaf});
    EXPECT_EQ(tree.root(), leaf);
    EXPECT_TRUE(tree.proof(0).empty());
}

TEST(MerkleTreeTest, TwoLeaves) {
    hash_t leaf1{}, leaf2{};
    leaf1[0] = 0x01;
    leaf2[0] = 0x02;

    MerkleTree tree({leaf1, leaf2});

    // Root should be H(leaf1 || leaf2)
    SHA3Hasher hasher;
    hasher.update(leaf1);
    hasher.update(leaf2);
    EXPECT_EQ(tree.root(), hasher.finalize());
}

TEST(MerkleTreeTest, ProofVerification) {
    // Odd sizes exercise the duplicated last node
    for (std::size_t count : {1u, 2u, 3u, 5u, 8u, 13u}) {
        std::vector<hash_t> leaves(count);
        for (std::size_t i = 0; i < count; ++i) {
            leaves[i][0] = static_cast<std::uint8_t>(i);
        }

        MerkleTree tree(leaves);
        for (std::size_t i = 0; i < count; ++i) {
            EXPECT_TRUE(MerkleTree::verify(leaves[i], tree.proof(i), i, tree.root()))
                << "leaf " << i << " of " << count;
        }
    }
}

TEST(MerkleTreeTest, InvalidProofFails) {
    std::vector<hash_t> leaves(4);
    for (int i = 0; i < 4; ++i) {
        leaves[i][0] = static_cast<std::uint8_t>(i);
    }

    MerkleTree tree(leaves);
    auto root = tree.root();

    // Get proof for index 0, but try to verify with leaf at index 1
    auto proof = tree.proof(0);
    EXPECT_FALSE(MerkleTree::verify(leaves[1], proof, 0, root));
    EXPECT_FALSE(MerkleTree::verify(leaves[0], proof, 1, root));
}

TEST(MerkleTreeTest, OutOfRangeProofIsEmpty) {
    std::vector<hash_t> leaves(3);
    MerkleTree tree(leaves);
    EXPECT_TRUE(tree.proof(3).empty());
}
