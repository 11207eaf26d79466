#pragma once

#include <tnid/result.hpp>
#include <cstdint>
#include <string>

namespace tnid {

// TNID type name: 1-4 characters from [0-4a-z].
// Packed into 20 bits, 5 bits per character, first character most
// significant; unused trailing slots hold the null value 0.
struct Name {
    static constexpr size_t kMaxLength = 4;
    static constexpr unsigned kBitWidth = 20;

    static Result<Name> parse(const std::string& raw);
    static Result<Name> from_bits(uint32_t bits);

    const std::string& str() const;
    uint32_t bits() const;

    // The 20 name bits as 5 lowercase hex digits, e.g. "user" -> "d6157".
    std::string hex() const;

    bool operator==(const Name& o) const;
    bool operator!=(const Name& o) const;
    bool operator<(const Name& o) const;

private:
    std::string value_;
    uint32_t bits_ = 0;
};

bool is_valid_name(const std::string& candidate);

} // namespace tnid
