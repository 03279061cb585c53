#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ud {

// SHA-256, lowercase hex.
std::string hashHex(const std::string& data);

// Append-only audit trail. Each event is stored as its hash; the Merkle root
// commits to the whole sequence.
class TranscriptLog {
public:
    // Returns the index of the new leaf.
    std::size_t append(const std::string& event);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }

private:
    std::vector<std::string> leaves_;
};

// Root over precomputed leaf hashes; an odd node is paired with itself.
std::string merkleRootOf(std::vector<std::string> layer);

} // namespace ud
