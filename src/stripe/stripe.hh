#pragma once

#include "codec/codec.hh"
#include "core/types.hh"
#include <bitset>
#include <optional>
#include <span>
#include <vector>

namespace rsec {

// ============================================================================
// Stripe Manifest
// ============================================================================

// Describes one encoded object: its geometry, the SHA3-256 digest of every
// shard and the Merkle root over those digests.
struct StripeManifest {
    std::uint16_t data_blocks = 0;
    std::uint16_t parity_blocks = 0;
    std::uint64_t object_size = 0;
    std::uint32_t shard_size = 0;
    hash_t root{};
    std::vector<hash_t> shard_digests;  // k + p entries

    [[nodiscard]] std::size_t total_blocks() const {
        return static_cast<std::size_t>(data_blocks) + parity_blocks;
    }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<StripeManifest> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t HEADER_SIZE =
        2 +             // data_blocks
        2 +             // parity_blocks
        8 +             // object_size
        4 +             // shard_size
        HASH_SIZE;      // root

    bool operator==(const StripeManifest&) const = default;
};

// ============================================================================
// Shard
// ============================================================================

struct Shard {
    block_index_t index = 0;
    std::vector<std::uint8_t> data;
    std::vector<hash_t> merkle_proof;  // Path from sha3_256(data) to the manifest root

    [[nodiscard]] bool verify(const hash_t& root) const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<Shard> deserialize(std::span<const std::uint8_t> data);
};

struct EncodedObject {
    StripeManifest manifest;
    std::vector<Shard> shards;  // k data shards then p parity shards
};

// Bytes per data shard when an object is split k ways, never less than one.
// Throws ErasureError(INVALID_PARAMETERS) when the size overflows the
// manifest's 32-bit shard_size field.
[[nodiscard]] std::uint32_t shard_size_for(std::uint64_t object_size, std::size_t k);

// Splits an object into k zero-padded data shards (at least one byte each),
// computes the p parity shards and builds the manifest.
[[nodiscard]] EncodedObject encode_object(const ErasureCodec& codec,
                                          std::span<const std::uint8_t> object);

// ============================================================================
// Shard Collector
// ============================================================================

class ShardCollector {
public:
    // The codec is held by reference and must outlive the collector.
    // Throws ErasureError(INVALID_PARAMETERS) when the manifest does not
    // describe a stripe this codec can rebuild.
    ShardCollector(const ErasureCodec& codec, StripeManifest manifest);
    ShardCollector(const ErasureCodec&&, StripeManifest) = delete;

    // Returns true once enough shards are held to rebuild the object.
    // Shards that disagree with the manifest are dropped.
    [[nodiscard]] bool add_shard(const Shard& shard);

    [[nodiscard]] bool can_reconstruct() const;
    [[nodiscard]] std::size_t shard_count() const { return available_.count(); }
    [[nodiscard]] std::vector<block_index_t> missing_shards() const;

    [[nodiscard]] const StripeManifest& manifest() const { return manifest_; }

    [[nodiscard]] std::optional<std::vector<std::uint8_t>> reconstruct() const;

private:
    const ErasureCodec& codec_;
    StripeManifest manifest_;
    std::vector<std::vector<std::uint8_t>> shards_;
    std::bitset<MAX_TOTAL_BLOCKS> available_;
};

}  // namespace rsec
