#include <tnid/filter.hpp>
#include <tnid/log.hpp>
#include <tnid/random.hpp>
#include <tnid/text.hpp>
#include <cctype>

namespace tnid {

static bool equals_ignore_case(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

Result<Blocklist> Blocklist::create(const std::vector<std::string>& patterns) {
    Blocklist list;
    for (const auto& p : patterns) {
        if (p.empty()) continue;
        for (char c : p) {
            if (!text::is_data_char(c)) {
                return TnidError{TnidError::InvalidArg,
                    "invalid blocklist pattern '" + p + "'",
                    "only TNID data characters are allowed: [-0-9A-Za-z_]"};
            }
        }
        list.patterns_.push_back(p);
    }
    return Result<Blocklist>::ok(std::move(list));
}

bool Blocklist::contains_match(const std::string& text) const {
    return find_first_match(text).has_value();
}

std::optional<BlocklistMatch> Blocklist::find_first_match(const std::string& text) const {
    for (size_t start = 0; start < text.size(); ++start) {
        for (const auto& p : patterns_) {
            if (p.size() > text.size() - start) continue;
            bool hit = true;
            for (size_t k = 0; k < p.size(); ++k) {
                if (!equals_ignore_case(text[start + k], p[k])) {
                    hit = false;
                    break;
                }
            }
            if (hit) return BlocklistMatch{start, p.size()};
        }
    }
    return std::nullopt;
}

uint64_t Blocklist::starting_timestamp(uint64_t now_ms) const {
    return now_ms > last_safe_timestamp_ ? now_ms : last_safe_timestamp_;
}

void Blocklist::record_safe_timestamp(uint64_t timestamp_ms) {
    if (timestamp_ms > last_safe_timestamp_) {
        last_safe_timestamp_ = timestamp_ms;
    }
}

uint64_t timestamp_bump_for_char(size_t pos) {
    return uint64_t(1) << (42 - 6 * pos);
}

Result<Tnid> new_v0_filtered(const Name& name, Blocklist& blocklist) {
    uint64_t timestamp = blocklist.starting_timestamp(unix_millis_now());

    for (int i = 0; i < kMaxV0FilterIterations; ++i) {
        Tnid id = Tnid::new_v0(name, timestamp, random_u64());
        auto match = blocklist.find_first_match(id.data_string());
        if (!match) {
            blocklist.record_safe_timestamp(timestamp);
            return Result<Tnid>::ok(id);
        }

        size_t end = match->start + match->length;
        if (end <= kFirstDataCharWithRandom) {
            timestamp += timestamp_bump_for_char(end - 1);
            log::trace("blocklist hit at [%zu, %zu) in timestamp bits, bumping to %llu",
                       match->start, end, static_cast<unsigned long long>(timestamp));
        } else {
            log::trace("blocklist hit at [%zu, %zu), redrawing random bits",
                       match->start, end);
        }
    }

    log::debug("no clean v0 id for '%s' after %d attempts",
               name.str().c_str(), kMaxV0FilterIterations);
    return TnidError{TnidError::FilterExhausted,
        "failed to generate clean ID after " + std::to_string(kMaxV0FilterIterations) +
        " iterations",
        "blocklist may be too restrictive"};
}

Result<Tnid> new_v0_filtered_for_encryption(const Name& name, Blocklist& blocklist,
                                            const EncryptionKey& key) {
    uint64_t timestamp = blocklist.starting_timestamp(unix_millis_now());

    for (int i = 0; i < kMaxEncryptionFilterIterations; ++i) {
        Tnid id = Tnid::new_v0(name, timestamp, random_u64());
        auto match = blocklist.find_first_match(id.data_string());
        if (match) {
            size_t end = match->start + match->length;
            if (end <= kFirstDataCharWithRandom) {
                timestamp += timestamp_bump_for_char(end - 1);
            }
            continue;
        }

        TNID_TRY_ASSIGN(Tnid encrypted, encrypt_v0_to_v1(id, key));
        if (!blocklist.contains_match(encrypted.data_string())) {
            blocklist.record_safe_timestamp(timestamp);
            return Result<Tnid>::ok(id);
        }
        log::trace("encrypted form %s is blocklisted, redrawing",
                   encrypted.to_string().c_str());
    }

    log::debug("no clean v0/v1 pair for '%s' after %d attempts",
               name.str().c_str(), kMaxEncryptionFilterIterations);
    return TnidError{TnidError::FilterExhausted,
        "failed to generate clean ID after " +
        std::to_string(kMaxEncryptionFilterIterations) + " iterations",
        "blocklist may be too restrictive"};
}

Result<Tnid> new_v1_filtered(const Name& name, const Blocklist& blocklist) {
    for (int i = 0; i < kMaxV1FilterIterations; ++i) {
        Tnid id = Tnid::generate_v1(name);
        if (!blocklist.contains_match(id.data_string())) {
            return Result<Tnid>::ok(id);
        }
    }

    log::debug("no clean v1 id for '%s' after %d attempts",
               name.str().c_str(), kMaxV1FilterIterations);
    return TnidError{TnidError::FilterExhausted,
        "failed to generate clean ID after " + std::to_string(kMaxV1FilterIterations) +
        " iterations",
        "blocklist may be too restrictive"};
}

} // namespace tnid
