// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#ifndef NEUTRONKEY_UUID_STRING_H
#define NEUTRONKEY_UUID_STRING_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"

namespace neutron::util {

// Hex digit counts of the five hyphen-separated UUID fields (RFC 4122).
inline constexpr size_t kUuidTimeLow = 8;
inline constexpr size_t kUuidTimeMid = 4;
inline constexpr size_t kUuidTimeHighVersion = 4;
inline constexpr size_t kUuidClockSeq = 4;
inline constexpr size_t kUuidNode = 12;

inline constexpr size_t kUuidTimeLen = kUuidTimeLow + kUuidTimeMid + kUuidTimeHighVersion;
inline constexpr size_t kUuidHexDigits = kUuidTimeLen + kUuidClockSeq + kUuidNode;
inline constexpr size_t kUuidStringLen = kUuidHexDigits + 4;

struct Uuid {
    uint64_t most_significant{0};
    uint64_t least_significant{0};
};

// Parses five hyphen-separated hex fields. Each field may be shorter or
// longer than its canonical width; excess high bits are dropped.
// Throws std::invalid_argument on a wrong field count, an empty field,
// a non-hex character or a field of more than 16 digits.
Uuid ParseUuid(absl::string_view text);

// Canonical lowercase 8-4-4-4-12 rendering.
std::string FormatUuid(const Uuid& uuid);

// True when text parses and formats back to itself, ignoring case.
// Throws std::invalid_argument when text does not parse.
bool RoundTripsAsUuid(absl::string_view text);

// Inserts hyphens at the 8-4-4-4-12 boundaries of a condensed UUID.
// Throws std::out_of_range when a field would read past the end of
// condensed. Characters past the last field are ignored.
std::string HyphenateUuid(absl::string_view condensed);

// Concatenates the segments between hyphens.
std::string StripHyphens(absl::string_view text);

}  // namespace neutron::util

#endif //NEUTRONKEY_UUID_STRING_H
