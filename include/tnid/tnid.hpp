#pragma once

#include <tnid/name.hpp>
#include <tnid/payload.hpp>
#include <tnid/result.hpp>
#include <tnid/text.hpp>
#include <tnid/u128.hpp>
#include <tnid/variant.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace tnid {

// A typed 128-bit identifier that is also a valid UUIDv8.
// Immutable; the variant always agrees with the tag bits of the value.
class Tnid {
public:
    // Deterministic constructors. See payload::encode_v0 for truncation.
    static Tnid new_v0(const Name& name, uint64_t timestamp_ms, uint64_t random);
    static Tnid new_v1(const Name& name, U128 random);

    // Clock and OS randomness.
    static Tnid generate_v0(const Name& name);
    static Tnid generate_v0_at(const Name& name, uint64_t timestamp_ms);
    static Tnid generate_v1(const Name& name);

    static Result<Tnid> from_u128(U128 value);

    // "<name>.<data>" (19-22 chars) or a 36-char UUID, detected by shape.
    static Result<Tnid> parse(const std::string& s);
    static Result<Tnid> parse_tnid_string(const std::string& s);
    // The string's name must be the given one, else NameMismatch.
    static Result<Tnid> parse_tnid_string(const Name& name, const std::string& s);

    // The UUID must carry the given name.
    static Result<Tnid> parse_uuid_string(const Name& name, const std::string& s);
    // Name taken from the UUID's name bits.
    static Result<Tnid> parse_uuid_string(const std::string& s);

    const Name& name() const { return name_; }
    Variant variant() const;
    U128 as_u128() const { return value_; }
    std::array<uint8_t, 16> bytes() const { return value_.to_bytes(); }
    std::string name_hex() const { return name_.hex(); }

    Decoded decode() const;
    Result<V0Fields> v0_fields() const;

    std::string to_string() const;
    // The 17 characters after the separator.
    std::string data_string() const;
    std::string to_uuid_string(Case c = Case::Lower) const;

    bool operator==(const Tnid& o) const { return value_ == o.value_; }
    bool operator!=(const Tnid& o) const { return value_ != o.value_; }
    bool operator<(const Tnid& o) const { return value_ < o.value_; }

private:
    Tnid(Name name, U128 value) : name_(std::move(name)), value_(value) {}

    Name name_;
    U128 value_;
};

} // namespace tnid
