#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace rsec {

namespace {

EVP_MD_CTX* as_ctx(void* ctx) {
    return static_cast<EVP_MD_CTX*>(ctx);
}

[[noreturn]] void digest_failure(const char* what) {
    log::crypto.error(what);
    throw std::runtime_error(what);
}

}  // namespace

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        digest_failure("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(as_ctx(ctx_));
        ctx_ = nullptr;
        digest_failure("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(as_ctx(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(as_ctx(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(as_ctx(ctx_), data, len) != 1) {
        digest_failure("SHA3-256 update failed");
    }
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(as_ctx(ctx_), result.data(), &len) != 1) {
        digest_failure("SHA3-256 finalize failed");
    }
    return result;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        digest_failure("SHA3-256 reset failed");
    }
}

hash_t sha3_256(std::span<const std::uint8_t> data) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data.data(), data.size(), result.data(), &out_len,
                   EVP_sha3_256(), nullptr) != 1) {
        digest_failure("SHA3-256 failed");
    }
    return result;
}

// ============================================================================
// MerkleTree Implementation
// ============================================================================

MerkleTree::MerkleTree(std::vector<hash_t> leaves) : leaves_(std::move(leaves)) {
    if (!leaves_.empty()) {
        build();
    }
}

void MerkleTree::build() {
    layers_.clear();
    layers_.push_back(leaves_);

    while (layers_.back().size() > 1) {
        const auto& prev = layers_.back();
        std::vector<hash_t> next;
        next.reserve((prev.size() + 1) / 2);

        for (std::size_t i = 0; i < prev.size(); i += 2) {
            const hash_t& right = (i + 1 < prev.size()) ? prev[i + 1] : prev[i];
            next.push_back(hash_pair(prev[i], right));
        }
        layers_.push_back(std::move(next));
    }

    root_ = layers_.back()[0];
}

hash_t MerkleTree::hash_pair(const hash_t& left, const hash_t& right) {
    SHA3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

std::vector<hash_t> MerkleTree::proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }

    std::vector<hash_t> proof;
    std::size_t idx = index;

    for (std::size_t layer = 0; layer + 1 < layers_.size(); ++layer) {
        const auto& current = layers_[layer];
        std::size_t sibling_idx = (idx % 2 == 0) ? idx + 1 : idx - 1;
        proof.push_back(sibling_idx < current.size() ? current[sibling_idx] : current[idx]);
        idx /= 2;
    }

    return proof;
}

bool MerkleTree::verify(const hash_t& leaf, const std::vector<hash_t>& proof,
                        std::size_t index, const hash_t& root) {
    hash_t current = leaf;
    std::size_t idx = index;

    for (const auto& sibling : proof) {
        current = (idx % 2 == 0) ? hash_pair(current, sibling) : hash_pair(sibling, current);
        idx /= 2;
    }

    return current == root;
}

}  // namespace rsec
