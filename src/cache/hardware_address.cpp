/*
 * hardware_address.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "hardware_address.hpp"

#include <algorithm>
#include <cstddef>

#include "core/exception.hpp"

namespace beacon::cache {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

enum class ParseStatus { Ok, BadLength, BadSeparator, BadDigit };

ParseStatus parseInto(std::string_view text,
                      HardwareAddress::Bytes& bytes) noexcept {
    if (text.size() != HardwareAddress::TEXT_LENGTH) {
        return ParseStatus::BadLength;
    }

    const char separator = text[2];
    if (separator != ':' && separator != '-') {
        return ParseStatus::BadSeparator;
    }

    // Exactly five separators, all of the same kind, at every third position
    const auto separatorCount = std::count_if(
        text.begin(), text.end(), [](char c) { return c == ':' || c == '-'; });
    if (separatorCount != static_cast<std::ptrdiff_t>(HardwareAddress::OCTETS - 1)) {
        return ParseStatus::BadSeparator;
    }

    for (std::size_t i = 0; i < HardwareAddress::OCTETS; ++i) {
        const std::size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != separator) {
            return ParseStatus::BadSeparator;
        }
        const int high = hexValue(text[pos]);
        const int low = hexValue(text[pos + 1]);
        if (high < 0 || low < 0) {
            return ParseStatus::BadDigit;
        }
        bytes[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return ParseStatus::Ok;
}

}  // namespace

HardwareAddress HardwareAddress::parse(std::string_view text) {
    Bytes bytes{};
    switch (parseInto(text, bytes)) {
        case ParseStatus::Ok:
            return HardwareAddress(bytes);
        case ParseStatus::BadLength:
            THROW_MALFORMED_ADDRESS("Invalid MAC address format '" +
                                    std::string(text) + "': expected " +
                                    std::to_string(TEXT_LENGTH) +
                                    " characters, got " +
                                    std::to_string(text.size()));
        case ParseStatus::BadSeparator:
            THROW_MALFORMED_ADDRESS("Invalid MAC address format '" +
                                    std::string(text) +
                                    "': expected five ':' or '-' separators");
        case ParseStatus::BadDigit:
            THROW_MALFORMED_ADDRESS("Invalid MAC address format '" +
                                    std::string(text) +
                                    "': non-hexadecimal digit");
    }
    THROW_MALFORMED_ADDRESS("Invalid MAC address format '" + std::string(text) +
                            "'");
}

bool HardwareAddress::tryParse(std::string_view text,
                               HardwareAddress& out) noexcept {
    Bytes bytes{};
    if (parseInto(text, bytes) != ParseStatus::Ok) {
        return false;
    }
    out = HardwareAddress(bytes);
    return true;
}

std::string HardwareAddress::toString() const {
    std::string text;
    text.reserve(TEXT_LENGTH);
    for (std::size_t i = 0; i < OCTETS; ++i) {
        if (i > 0) {
            text.push_back(':');
        }
        text.push_back(HEX_DIGITS[bytes_[i] >> 4]);
        text.push_back(HEX_DIGITS[bytes_[i] & 0x0F]);
    }
    return text;
}

std::ostream& operator<<(std::ostream& os, const HardwareAddress& address) {
    return os << address.toString();
}

}  // namespace beacon::cache
