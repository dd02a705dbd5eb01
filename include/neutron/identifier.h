// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

// Validation of neutron object identifiers and their conversion to the
// key syntax of the backing key-value store. Keys must be shorter than
// 32 characters, so a 36 character UUID is shortened to 31 by dropping
// its hyphens and its version digit.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace neutron {

// Neutron UUID identifier length.
inline constexpr size_t kUuidIdLen = 36;

// Tenant id length when a keystone identifier is used in neutron.
inline constexpr size_t kKeystoneIdLen = 32;

// Position of the UUID version digit once the hyphens are removed.
inline constexpr size_t kUuidVersionPos = 12;

enum class IdentifierShape {
    kInvalid,
    kUuid,      // canonical 36 character UUID string
    kKeystone,  // 32 characters, assumed to be a condensed UUID
    kShort      // 1 to 31 characters, already a valid key
};

std::string_view IdentifierShapeName(IdentifierShape shape);

// Shape of a valid identifier, kInvalid when IsValidIdentifier is false.
IdentifierShape ClassifyIdentifier(std::optional<std::string_view> id);

// A 36 character id must be a UUID that formats back to itself ignoring
// case. Any 1 to 32 character id is valid without further checks.
bool IsValidIdentifier(std::optional<std::string_view> id);

// Removes the hyphens and the version digit of a validated UUID string.
std::optional<std::string> ConvertUuidToKey(std::string_view id);

// Re-hyphenates a 32 character keystone id, checks it is a UUID and
// converts it as such. No key when it is not, even though the id passed
// IsValidIdentifier.
std::optional<std::string> ConvertKeystoneIdToKey(std::string_view id);

// Key for any valid identifier; short identifiers are used as they are.
std::optional<std::string> ConvertIdentifierToKey(std::optional<std::string_view> id);

}  // namespace neutron
