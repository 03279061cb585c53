#include "transcript_log.hpp"

#include "picosha2.h"

#include <utility>
#include <vector>

namespace ud {

namespace {

std::string hashPair(const std::string& left, const std::string& right) {
    return hashHex(left + right);
}

std::vector<std::string> nextLayer(const std::vector<std::string>& layer) {
    std::vector<std::string> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
        const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
        next.push_back(hashPair(layer[i], right));
    }
    return next;
}

} // namespace

std::string hashHex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string merkleRootOf(std::vector<std::string> layer) {
    if (layer.empty()) {
        return {};
    }
    while (layer.size() > 1) {
        layer = nextLayer(layer);
    }
    return layer.front();
}

std::size_t TranscriptLog::append(const std::string& event) {
    leaves_.push_back(hashHex(event));
    return leaves_.size() - 1;
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::merkleRoot() const {
    return merkleRootOf(leaves_);
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
        proof.push_back(sibling < layer.size() ? layer[sibling] : layer[index]);
        layer = nextLayer(layer);
        index /= 2;
    }
    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leafHash,
                                std::size_t leafIndex,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string node = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        node = (index % 2 == 0) ? hashPair(node, sibling) : hashPair(sibling, node);
        index /= 2;
    }
    return index == 0 && node == root;
}

} // namespace ud
