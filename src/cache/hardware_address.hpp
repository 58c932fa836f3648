/*
 * hardware_address.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Validated 6-byte hardware (MAC) address used as cache key

**************************************************/

#ifndef BEACON_CACHE_HARDWARE_ADDRESS_HPP
#define BEACON_CACHE_HARDWARE_ADDRESS_HPP

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace beacon::cache {

/**
 * @brief Six-octet device identifier
 *
 * Equality, ordering and hashing are defined over the octets, so
 * "AA:BB:CC:DD:EE:FF" and "aa:bb:cc:dd:ee:ff" name the same device.
 */
class HardwareAddress {
public:
    static constexpr std::size_t OCTETS = 6;
    static constexpr std::size_t TEXT_LENGTH = 17;  ///< "aa:bb:cc:dd:ee:ff"

    using Bytes = std::array<std::uint8_t, OCTETS>;

    constexpr HardwareAddress() noexcept = default;
    constexpr explicit HardwareAddress(const Bytes& bytes) noexcept
        : bytes_(bytes) {}

    /**
     * @brief Parse "aa:bb:cc:dd:ee:ff" or "AA-BB-CC-DD-EE-FF"
     * @throws MalformedAddressError on wrong length, non-hex digits or a
     *         wrong separator count
     */
    [[nodiscard]] static HardwareAddress parse(std::string_view text);

    /**
     * @brief Non-throwing parse
     * @return true and fills @p out when @p text is well formed
     */
    [[nodiscard]] static bool tryParse(std::string_view text,
                                       HardwareAddress& out) noexcept;

    /**
     * @brief Canonical lower-case, colon separated form
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    /**
     * @brief The 48-bit value packed into the low bits of an integer
     */
    [[nodiscard]] constexpr std::uint64_t toUint64() const noexcept {
        std::uint64_t value = 0;
        for (auto octet : bytes_) {
            value = (value << 8) | octet;
        }
        return value;
    }

    friend constexpr bool operator==(const HardwareAddress&,
                                     const HardwareAddress&) = default;
    friend constexpr auto operator<=>(const HardwareAddress&,
                                      const HardwareAddress&) = default;

private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const HardwareAddress& address);

/**
 * @brief 64-bit mix of the octets
 *
 * splitmix64 finaliser, spreads the vendor prefix across all bits.
 */
[[nodiscard]] constexpr std::uint64_t mixAddress(
    const HardwareAddress& address) noexcept {
    std::uint64_t x = address.toUint64();
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

}  // namespace beacon::cache

template <>
struct std::hash<beacon::cache::HardwareAddress> {
    std::size_t operator()(
        const beacon::cache::HardwareAddress& address) const noexcept {
        return static_cast<std::size_t>(beacon::cache::mixAddress(address));
    }
};

#endif  // BEACON_CACHE_HARDWARE_ADDRESS_HPP
