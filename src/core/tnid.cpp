#include <tnid/tnid.hpp>
#include <tnid/random.hpp>

namespace tnid {

// ---- Construction ----

Tnid Tnid::new_v0(const Name& name, uint64_t timestamp_ms, uint64_t random) {
    return Tnid(name, payload::with_name(payload::encode_v0(timestamp_ms, random), name));
}

Tnid Tnid::new_v1(const Name& name, U128 random) {
    return Tnid(name, payload::with_name(payload::encode_v1(random), name));
}

Tnid Tnid::generate_v0(const Name& name) {
    return new_v0(name, unix_millis_now(), random_u64());
}

Tnid Tnid::generate_v0_at(const Name& name, uint64_t timestamp_ms) {
    return new_v0(name, timestamp_ms, random_u64());
}

Tnid Tnid::generate_v1(const Name& name) {
    return new_v1(name, random_u128());
}

Result<Tnid> Tnid::from_u128(U128 value) {
    if (!payload::has_uuid_marker(value)) {
        return TnidError{TnidError::UnknownVariant,
            "not a TNID: UUID version/variant bits are not v8/0b10"};
    }
    TNID_TRY_ASSIGN(Name name, Name::from_bits(payload::name_bits(value)));
    return Result<Tnid>::ok(Tnid(std::move(name), value));
}

// ---- Parsing ----

Result<Tnid> Tnid::parse(const std::string& s) {
    if (s.size() == text::kUuidLength) {
        return parse_uuid_string(s);
    }
    if (s.size() >= text::kDataLength + 2 &&
        s.size() <= text::kDataLength + 1 + Name::kMaxLength &&
        s.find(text::kSeparator) != std::string::npos) {
        return parse_tnid_string(s);
    }
    return TnidError{TnidError::MalformedString,
        "not a TNID: expected TNID string (19-22 chars) or UUID (36 chars), got " +
        std::to_string(s.size()) + " chars"};
}

Result<Tnid> Tnid::parse_tnid_string(const std::string& s) {
    auto dot = s.find(text::kSeparator);
    if (dot == std::string::npos) {
        return TnidError{TnidError::MalformedString,
            "TNID string is missing the '.' separator",
            "expected <name>.<data>, e.g. user.Br2flcNDfF6LYICnT"};
    }

    auto name = Name::parse(s.substr(0, dot));
    if (name.is_err()) {
        return TnidError{TnidError::MalformedString,
            "invalid TNID name: " + name.error().message,
            name.error().hint};
    }

    TNID_TRY_ASSIGN(U128 value, text::decode_data(s.substr(dot + 1), name.value()));
    return Result<Tnid>::ok(Tnid(std::move(name).value(), value));
}

Result<Tnid> Tnid::parse_tnid_string(const Name& name, const std::string& s) {
    auto dot = s.find(text::kSeparator);
    if (dot != std::string::npos && s.compare(0, dot, name.str()) != 0) {
        return TnidError{TnidError::NameMismatch,
            "TNID name mismatch: expected '" + name.str() + "', got '" +
            s.substr(0, dot) + "'"};
    }
    return parse_tnid_string(s);
}

Result<Tnid> Tnid::parse_uuid_string(const Name& name, const std::string& s) {
    TNID_TRY_ASSIGN(U128 value, text::parse_uuid(s));
    if (!payload::has_uuid_marker(value)) {
        return TnidError{TnidError::UnknownVariant,
            "UUID is not a TNID: version/variant bits are not v8/0b10"};
    }

    uint32_t found = payload::name_bits(value);
    if (found != name.bits()) {
        auto found_name = Name::from_bits(found);
        return TnidError{TnidError::NameMismatch,
            "TNID name mismatch: expected '" + name.str() + "', got '" +
            (found_name.is_ok() ? found_name.value().str() : std::string("<invalid>")) + "'"};
    }
    return Result<Tnid>::ok(Tnid(name, value));
}

Result<Tnid> Tnid::parse_uuid_string(const std::string& s) {
    TNID_TRY_ASSIGN(U128 value, text::parse_uuid(s));
    return from_u128(value);
}

// ---- Accessors ----

Variant Tnid::variant() const {
    return payload::variant_of(value_);
}

Decoded Tnid::decode() const {
    // Every constructor checks the UUID marker, so decode cannot fail here.
    return payload::decode(value_).value();
}

Result<V0Fields> Tnid::v0_fields() const {
    if (variant() != Variant::V0) {
        return TnidError{TnidError::WrongVariant,
            std::string("expected a v0 TNID, got ") + variant_name(variant())};
    }
    return Result<V0Fields>::ok(std::get<V0Fields>(decode().fields));
}

std::string Tnid::to_string() const {
    return name_.str() + text::kSeparator + text::encode_data(value_);
}

std::string Tnid::data_string() const {
    return text::encode_data(value_);
}

std::string Tnid::to_uuid_string(Case c) const {
    return text::format_uuid(value_, c);
}

} // namespace tnid
