#include <tnid/variant.hpp>

namespace tnid {

const char* variant_name(Variant v) {
    switch (v) {
        case Variant::V0: return "v0";
        case Variant::V1: return "v1";
        case Variant::V2: return "v2";
        case Variant::V3: return "v3";
    }
    return "unknown";
}

Result<Variant> parse_variant(const std::string& name) {
    if (name == "v0" || name == "V0") return Result<Variant>::ok(Variant::V0);
    if (name == "v1" || name == "V1") return Result<Variant>::ok(Variant::V1);
    if (name == "v2" || name == "V2") return Result<Variant>::ok(Variant::V2);
    if (name == "v3" || name == "V3") return Result<Variant>::ok(Variant::V3);
    return TnidError{TnidError::UnknownVariant,
        "unknown variant '" + name + "'",
        "expected one of: v0, v1, v2, v3"};
}

} // namespace tnid
