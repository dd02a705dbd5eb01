// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "neutron/identifier.h"

#include <stdexcept>

#include "absl/strings/string_view.h"
#include "neutron/logging.h"
#include "util/uuid_string.h"

namespace neutron {

namespace {

absl::string_view ToAbsl(std::string_view view) {
    return absl::string_view(view.data(), view.size());
}

}  // namespace

std::string_view IdentifierShapeName(IdentifierShape shape) {
    switch (shape) {
        case IdentifierShape::kUuid:     return "uuid";
        case IdentifierShape::kKeystone: return "keystone";
        case IdentifierShape::kShort:    return "short";
        case IdentifierShape::kInvalid:  return "invalid";
    }
    return "invalid";
}

bool IsValidIdentifier(std::optional<std::string_view> id) {
    if (!id) {
        return false;
    }
    Logger()->trace("id - {}, length - {}", *id, id->size());

    // 36 characters is a UUID; up to 32 may be a keystone tenant id or
    // any shorter id.
    if (id->size() == kUuidIdLen) {
        try {
            return util::RoundTripsAsUuid(ToAbsl(*id));
        } catch (const std::invalid_argument& e) {
            Logger()->error("Invalid UUID - {}: {}", *id, e.what());
            return false;
        }
    }
    return !id->empty() && id->size() <= kKeystoneIdLen;
}

IdentifierShape ClassifyIdentifier(std::optional<std::string_view> id) {
    if (!IsValidIdentifier(id)) {
        return IdentifierShape::kInvalid;
    }
    if (id->size() == kUuidIdLen) {
        return IdentifierShape::kUuid;
    }
    if (id->size() == kKeystoneIdLen) {
        return IdentifierShape::kKeystone;
    }
    return IdentifierShape::kShort;
}

std::optional<std::string> ConvertUuidToKey(std::string_view id) {
    Logger()->trace("id - {}, length - {}", id, id.size());

    std::string key = util::StripHyphens(ToAbsl(id));
    if (key.size() <= kUuidVersionPos) {
        Logger()->error("Invalid UUID - {}", id);
        return std::nullopt;
    }
    key.erase(kUuidVersionPos, 1);
    return key;
}

std::optional<std::string> ConvertKeystoneIdToKey(std::string_view id) {
    Logger()->trace("id - {}, length - {}", id, id.size());

    // Keystone tenant ids drop the UUID hyphens; restore them to validate.
    std::string candidate;
    try {
        candidate = util::HyphenateUuid(ToAbsl(id));
        if (!util::RoundTripsAsUuid(candidate)) {
            Logger()->debug("Keystone id {} is not a UUID", id);
            return std::nullopt;
        }
    } catch (const std::out_of_range& e) {
        Logger()->error("Invalid UUID - {}: {}", id, e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        Logger()->error("Invalid object ID - {}: {}", id, e.what());
        return std::nullopt;
    }
    return ConvertUuidToKey(candidate);
}

std::optional<std::string> ConvertIdentifierToKey(std::optional<std::string_view> id) {
    if (!id) {
        return std::nullopt;
    }
    Logger()->trace("neutronID - {}, length - {}", *id, id->size());

    switch (ClassifyIdentifier(id)) {
        case IdentifierShape::kUuid:
            return ConvertUuidToKey(*id);
        case IdentifierShape::kKeystone:
            return ConvertKeystoneIdToKey(*id);
        case IdentifierShape::kShort:
            return std::string(*id);
        case IdentifierShape::kInvalid:
            break;
    }
    return std::nullopt;
}

}  // namespace neutron
