// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "uuid_string.h"

#include <cctype>
#include <stdexcept>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"

namespace neutron::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

uint64_t ParseHexField(absl::string_view field, size_t width) {
    if (field.empty()) {
        throw std::invalid_argument("UUID field is empty.");
    }
    if (field.size() > 16) {
        throw std::invalid_argument("UUID field has more than 16 hex digits.");
    }

    uint64_t value = 0;
    for (char c : field) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) {
            throw std::invalid_argument("UUID contains non-hex characters.");
        }
        const int digit = std::isdigit(uc) ? uc - '0' : std::tolower(uc) - 'a' + 10;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }

    const size_t bits = width * 4;
    return bits >= 64 ? value : value & ((uint64_t{1} << bits) - 1);
}

void AppendHex(std::string& out, uint64_t value, size_t digits) {
    for (size_t i = digits; i-- != 0;) {
        out.push_back(kHexDigits[(value >> (i * 4)) & 0xf]);
    }
}

absl::string_view Slice(absl::string_view text, size_t begin, size_t end) {
    if (end > text.size()) {
        throw std::out_of_range(absl::StrCat("slice [", begin, ", ", end,
                                             ") exceeds length ", text.size()));
    }
    return text.substr(begin, end - begin);
}

}  // namespace

Uuid ParseUuid(absl::string_view text) {
    const std::vector<absl::string_view> fields = absl::StrSplit(text, '-');
    if (fields.size() != 5) {
        throw std::invalid_argument("UUID must have five hyphen-separated fields.");
    }

    const uint64_t time_low = ParseHexField(fields[0], kUuidTimeLow);
    const uint64_t time_mid = ParseHexField(fields[1], kUuidTimeMid);
    const uint64_t time_hi = ParseHexField(fields[2], kUuidTimeHighVersion);
    const uint64_t clock_seq = ParseHexField(fields[3], kUuidClockSeq);
    const uint64_t node = ParseHexField(fields[4], kUuidNode);

    Uuid uuid;
    uuid.most_significant = (time_low << 32) | (time_mid << 16) | time_hi;
    uuid.least_significant = (clock_seq << 48) | node;
    return uuid;
}

std::string FormatUuid(const Uuid& uuid) {
    std::string result;
    result.reserve(kUuidStringLen);
    AppendHex(result, uuid.most_significant >> 32, kUuidTimeLow);
    result.push_back('-');
    AppendHex(result, uuid.most_significant >> 16, kUuidTimeMid);
    result.push_back('-');
    AppendHex(result, uuid.most_significant, kUuidTimeHighVersion);
    result.push_back('-');
    AppendHex(result, uuid.least_significant >> 48, kUuidClockSeq);
    result.push_back('-');
    AppendHex(result, uuid.least_significant, kUuidNode);
    return result;
}

bool RoundTripsAsUuid(absl::string_view text) {
    return absl::EqualsIgnoreCase(FormatUuid(ParseUuid(text)), text);
}

std::string HyphenateUuid(absl::string_view condensed) {
    constexpr size_t kMidEnd = kUuidTimeLow + kUuidTimeMid;
    constexpr size_t kClockEnd = kUuidTimeLen + kUuidClockSeq;
    constexpr size_t kNodeEnd = kClockEnd + kUuidNode;

    return absl::StrJoin({Slice(condensed, 0, kUuidTimeLow),
                          Slice(condensed, kUuidTimeLow, kMidEnd),
                          Slice(condensed, kMidEnd, kUuidTimeLen),
                          Slice(condensed, kUuidTimeLen, kClockEnd),
                          Slice(condensed, kClockEnd, kNodeEnd)},
                         "-");
}

std::string StripHyphens(absl::string_view text) {
    return absl::StrReplaceAll(text, {{"-", ""}});
}

}  // namespace neutron::util
