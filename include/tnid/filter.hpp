#pragma once

#include <tnid/encryption.hpp>
#include <tnid/name.hpp>
#include <tnid/result.hpp>
#include <tnid/tnid.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tnid {

struct BlocklistMatch {
    size_t start = 0;
    size_t length = 0;
};

// Case-insensitive substring blocklist for TNID data strings.
//
// Also remembers the last timestamp that produced a clean V0 id so that
// later generations skip windows already known to be blocked. Not safe to
// share between threads without external locking.
class Blocklist {
public:
    // Empty patterns are dropped. Patterns must use the data alphabet
    // [-0-9A-Za-z_], otherwise InvalidArg.
    static Result<Blocklist> create(const std::vector<std::string>& patterns);

    bool empty() const { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

    bool contains_match(const std::string& text) const;
    // Leftmost match; at equal positions the earlier pattern wins.
    std::optional<BlocklistMatch> find_first_match(const std::string& text) const;

    uint64_t starting_timestamp(uint64_t now_ms) const;
    void record_safe_timestamp(uint64_t timestamp_ms);

private:
    std::vector<std::string> patterns_;
    uint64_t last_safe_timestamp_ = 0;
};

constexpr int kMaxV0FilterIterations = 1000;
constexpr int kMaxV1FilterIterations = 100;
constexpr int kMaxEncryptionFilterIterations = 1000;

// Data characters 0..6 of a V0 id carry no random bits.
constexpr size_t kFirstDataCharWithRandom = 7;

// Generates a V0 id whose data string avoids every blocklisted word.
// Matches inside the timestamp-only prefix bump the timestamp past the
// offending character; other matches redraw the random bits.
// Fails with FilterExhausted after kMaxV0FilterIterations attempts.
Result<Tnid> new_v0_filtered(const Name& name, Blocklist& blocklist);

// Redraws until clean; FilterExhausted after kMaxV1FilterIterations.
Result<Tnid> new_v1_filtered(const Name& name, const Blocklist& blocklist);

// Like new_v0_filtered, but the V1 id the result encrypts to under key must
// be clean as well. A V1 hit redraws the random bits. Only a clean pair
// records the safe timestamp.
// Fails with FilterExhausted after kMaxEncryptionFilterIterations attempts.
Result<Tnid> new_v0_filtered_for_encryption(const Name& name, Blocklist& blocklist,
                                            const EncryptionKey& key);

// Smallest timestamp increment that changes data character pos (0..6).
uint64_t timestamp_bump_for_char(size_t pos);

} // namespace tnid
