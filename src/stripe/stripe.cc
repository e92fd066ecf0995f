#include "stripe/stripe.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <limits>
#include <string>

namespace rsec {

// ============================================================================
// StripeManifest Implementation
// ============================================================================

std::vector<std::uint8_t> StripeManifest::serialize() const {
    std::vector<std::uint8_t> result(HEADER_SIZE + shard_digests.size() * HASH_SIZE);
    std::uint8_t* out = result.data();

    encode_u16(out, data_blocks);
    out += 2;
    encode_u16(out, parity_blocks);
    out += 2;
    encode_u64(out, object_size);
    out += 8;
    encode_u32(out, shard_size);
    out += 4;
    out = std::copy(root.begin(), root.end(), out);

    for (const auto& digest : shard_digests) {
        out = std::copy(digest.begin(), digest.end(), out);
    }

    return result;
}

std::optional<StripeManifest> StripeManifest::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < HEADER_SIZE) return std::nullopt;

    StripeManifest result;
    std::size_t offset = 0;

    result.data_blocks = decode_u16(data.data() + offset);
    offset += 2;
    result.parity_blocks = decode_u16(data.data() + offset);
    offset += 2;
    result.object_size = decode_u64(data.data() + offset);
    offset += 8;
    result.shard_size = decode_u32(data.data() + offset);
    offset += 4;
    std::copy_n(data.begin() + offset, HASH_SIZE, result.root.begin());
    offset += HASH_SIZE;

    const std::size_t n = result.total_blocks();
    if (result.data_blocks == 0 || n > MAX_TOTAL_BLOCKS) return std::nullopt;
    if (data.size() != offset + n * HASH_SIZE) return std::nullopt;

    result.shard_digests.resize(n);
    for (std::size_t i = 0; i < n; i++) {
        std::copy_n(data.begin() + offset, HASH_SIZE, result.shard_digests[i].begin());
        offset += HASH_SIZE;
    }

    if (MerkleTree(result.shard_digests).root() != result.root) {
        RSEC_LOG_DEBUG(log::stripe) << "Manifest root does not cover its shard digests";
        return std::nullopt;
    }

    return result;
}

// ============================================================================
// Shard Implementation
// ============================================================================

bool Shard::verify(const hash_t& root) const {
    return MerkleTree::verify(sha3_256(data), merkle_proof, index, root);
}

std::vector<std::uint8_t> Shard::serialize() const {
    std::vector<std::uint8_t> result(2 + 4 + data.size() + 4 + merkle_proof.size() * HASH_SIZE);
    std::uint8_t* out = result.data();

    encode_u16(out, static_cast<std::uint16_t>(index));
    out += 2;
    encode_u32(out, static_cast<std::uint32_t>(data.size()));
    out += 4;
    out = std::copy(data.begin(), data.end(), out);
    encode_u32(out, static_cast<std::uint32_t>(merkle_proof.size()));
    out += 4;

    for (const auto& node : merkle_proof) {
        out = std::copy(node.begin(), node.end(), out);
    }

    return result;
}

std::optional<Shard> Shard::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < 10) return std::nullopt;

    Shard result;
    std::size_t offset = 0;

    result.index = decode_u16(data.data() + offset);
    offset += 2;

    std::uint32_t data_len = decode_u32(data.data() + offset);
    offset += 4;

    if (data.size() - offset < static_cast<std::size_t>(data_len) + 4) return std::nullopt;
    result.data.assign(data.begin() + offset, data.begin() + offset + data_len);
    offset += data_len;

    std::uint32_t proof_len = decode_u32(data.data() + offset);
    offset += 4;

    if (data.size() - offset != static_cast<std::size_t>(proof_len) * HASH_SIZE) {
        return std::nullopt;
    }
    result.merkle_proof.resize(proof_len);
    for (std::uint32_t i = 0; i < proof_len; i++) {
        std::copy_n(data.begin() + offset, HASH_SIZE, result.merkle_proof[i].begin());
        offset += HASH_SIZE;
    }

    return result;
}

// ============================================================================
// Object Encoding
// ============================================================================

std::uint32_t shard_size_for(std::uint64_t object_size, std::size_t k) {
    if (k == 0) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS, "k must be positive");
    }
    const std::uint64_t size = object_size / k + (object_size % k != 0 ? 1 : 0);
    if (size > std::numeric_limits<std::uint32_t>::max()) {
        log::stripe.warn() << "Object of " << object_size << " bytes needs " << size
                           << "-byte shards";
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "object of " + std::to_string(object_size) + " bytes needs shards of " +
            std::to_string(size) + " bytes, above the 32-bit shard size limit");
    }
    return size == 0 ? 1 : static_cast<std::uint32_t>(size);
}

EncodedObject encode_object(const ErasureCodec& codec, std::span<const std::uint8_t> object) {
    const std::size_t k = codec.data_blocks();
    const std::size_t n = codec.total_blocks();

    const std::size_t shard_size = shard_size_for(object.size(), k);

    EncodedObject result;
    result.shards.resize(n);

    for (std::size_t i = 0; i < n; i++) {
        result.shards[i].index = static_cast<block_index_t>(i);
        result.shards[i].data.assign(shard_size, 0);
    }

    for (std::size_t i = 0; i < k; i++) {
        const std::size_t begin = std::min(object.size(), i * shard_size);
        const std::size_t end = std::min(object.size(), begin + shard_size);
        std::copy(object.begin() + begin, object.begin() + end, result.shards[i].data.begin());
    }

    std::vector<ConstBlock> data(k);
    for (std::size_t i = 0; i < k; i++) {
        data[i] = result.shards[i].data;
    }
    std::vector<MutableBlock> coding(n - k);
    for (std::size_t j = 0; j < n - k; j++) {
        coding[j] = result.shards[k + j].data;
    }
    codec.encode(shard_size, data, coding);

    auto& manifest = result.manifest;
    manifest.data_blocks = static_cast<std::uint16_t>(k);
    manifest.parity_blocks = static_cast<std::uint16_t>(n - k);
    manifest.object_size = object.size();
    manifest.shard_size = static_cast<std::uint32_t>(shard_size);  // Bounded by shard_size_for
    manifest.shard_digests.reserve(n);
    for (const auto& shard : result.shards) {
        manifest.shard_digests.push_back(sha3_256(shard.data));
    }

    MerkleTree tree(manifest.shard_digests);
    manifest.root = tree.root();
    for (std::size_t i = 0; i < n; i++) {
        result.shards[i].merkle_proof = tree.proof(i);
    }

    RSEC_LOG_DEBUG(log::stripe) << "Encoded " << object.size() << " bytes into " << n
                                << " shards of " << shard_size << " bytes";

    return result;
}

// ============================================================================
// ShardCollector Implementation
// ============================================================================

ShardCollector::ShardCollector(const ErasureCodec& codec, StripeManifest manifest)
    : codec_(codec)
    , manifest_(std::move(manifest)) {
    if (manifest_.data_blocks != codec_.data_blocks() ||
        manifest_.parity_blocks != codec_.parity_blocks()) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "manifest geometry " + std::to_string(manifest_.data_blocks) + "+" +
            std::to_string(manifest_.parity_blocks) + " does not match codec " +
            std::to_string(codec_.data_blocks()) + "+" +
            std::to_string(codec_.parity_blocks()));
    }
    if (manifest_.shard_digests.size() != manifest_.total_blocks()) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "manifest lists " + std::to_string(manifest_.shard_digests.size()) +
            " digests for " + std::to_string(manifest_.total_blocks()) + " shards");
    }
    if (MerkleTree(manifest_.shard_digests).root() != manifest_.root) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "manifest root does not match its shard digests");
    }
    if (manifest_.shard_size == 0 ||
        manifest_.object_size > static_cast<std::uint64_t>(manifest_.shard_size) *
                                    manifest_.data_blocks) {
        throw ErasureError(ErrorCode::INVALID_PARAMETERS,
            "object of " + std::to_string(manifest_.object_size) + " bytes does not fit " +
            std::to_string(manifest_.data_blocks) + " shards of " +
            std::to_string(manifest_.shard_size) + " bytes");
    }
    shards_.resize(manifest_.total_blocks());
}

bool ShardCollector::add_shard(const Shard& shard) {
    if (shard.index >= manifest_.total_blocks()) {
        log::stripe.debug() << "Shard index " << shard.index << " out of range";
        return false;
    }

    if (available_[shard.index]) {
        return can_reconstruct();
    }

    if (shard.data.size() != manifest_.shard_size) {
        RSEC_LOG_DEBUG(log::stripe) << "Shard " << shard.index << " has " << shard.data.size()
                                    << " bytes, expected " << manifest_.shard_size;
        return false;
    }

    if (sha3_256(shard.data) != manifest_.shard_digests[shard.index]) {
        RSEC_LOG_DEBUG(log::stripe) << "Shard digest mismatch for index " << shard.index;
        return false;
    }

    if (!shard.verify(manifest_.root)) {
        RSEC_LOG_DEBUG(log::stripe) << "Shard Merkle proof invalid for index " << shard.index;
        return false;
    }

    shards_[shard.index] = shard.data;
    available_.set(shard.index);

    return can_reconstruct();
}

bool ShardCollector::can_reconstruct() const {
    return available_.count() >= manifest_.data_blocks;
}

std::vector<block_index_t> ShardCollector::missing_shards() const {
    std::vector<block_index_t> missing;
    for (std::size_t i = 0; i < manifest_.total_blocks(); i++) {
        if (!available_[i]) {
            missing.push_back(static_cast<block_index_t>(i));
        }
    }
    return missing;
}

std::optional<std::vector<std::uint8_t>> ShardCollector::reconstruct() const {
    if (!can_reconstruct()) {
        RSEC_LOG_DEBUG(log::stripe) << "Not enough shards for reconstruction: "
                                    << available_.count() << " < " << manifest_.data_blocks;
        return std::nullopt;
    }

    const std::size_t k = manifest_.data_blocks;
    const std::size_t n = manifest_.total_blocks();
    const std::size_t len = manifest_.shard_size;

    auto erasures = missing_shards();
    std::vector<std::vector<std::uint8_t>> rebuilt(erasures.size(),
                                                   std::vector<std::uint8_t>(len));

    if (!erasures.empty()) {
        std::vector<ConstBlock> blocks(n);
        for (std::size_t i = 0; i < n; i++) {
            if (available_[i]) {
                blocks[i] = shards_[i];
            }
        }
        std::vector<MutableBlock> outputs(rebuilt.begin(), rebuilt.end());

        try {
            codec_.decode(len, erasures, blocks, outputs);
        } catch (const ErasureError& e) {
            log::stripe.warn() << "Reconstruction failed: " << e.what();
            return std::nullopt;
        }
    }

    std::vector<std::uint8_t> result;
    result.reserve(k * len);
    std::size_t next_rebuilt = 0;
    for (std::size_t i = 0; i < k; i++) {
        if (available_[i]) {
            result.insert(result.end(), shards_[i].begin(), shards_[i].end());
        } else {
            // Erasures are ascending, so data indices come first.
            const auto& shard = rebuilt[next_rebuilt++];
            result.insert(result.end(), shard.begin(), shard.end());
        }
    }

    result.resize(manifest_.object_size);
    return result;
}

}  // namespace rsec
