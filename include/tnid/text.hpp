#pragma once

#include <tnid/name.hpp>
#include <tnid/result.hpp>
#include <tnid/u128.hpp>
#include <string>

namespace tnid {

enum class Case { Lower, Upper };

namespace text {

// Data alphabet, value order: - 0-9 A-Z _ a-z
constexpr size_t kDataLength = 17;
constexpr size_t kUuidLength = 36;
constexpr char kSeparator = '.';

bool is_data_char(char c);

// 17-character data string for a 128-bit TNID value. The 102 data bits are
// payload A(28) | payload B(12) | variant(2) | payload C(60).
std::string encode_data(U128 value);

// Rebuilds the full 128-bit value (name, UUID bits and data) from a data
// string. Fails with MalformedString on wrong length or alphabet.
Result<U128> decode_data(const std::string& data, const Name& name);

// xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
std::string format_uuid(U128 value, Case c);

// Accepts either hex case. Fails with MalformedUuid.
Result<U128> parse_uuid(const std::string& s);

} // namespace text
} // namespace tnid
