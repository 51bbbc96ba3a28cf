/**
 * @file chunk_type.hh
 * @brief Four-byte PNG chunk type code and its property bits
 */
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @struct chunk_type
     * @brief PNG chunk type code
     *
     * Bit 5 (the ASCII case bit) of each byte carries a property:
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * A set bit (lowercase letter) means the property holds.
     *
     * Raw-byte construction never validates, since chunks read from real
     * files may carry any pattern. from_string() accepts only four ASCII
     * letters.
     */
    struct PNGCHUNK_EXPORT chunk_type {
        static constexpr std::uint8_t property_bit = 0x20;

        std::array<std::uint8_t, 4> b{0, 0, 0, 0};

        constexpr chunk_type() = default;

        // Constructor from 4 individual chars (no validation)
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes (no validation)
        static constexpr chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            chunk_type result;
            result.b = bytes;
            return result;
        }

        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Parse a type from text
         * @throws invalid_chunk_type unless text is exactly four ASCII letters
         */
        static chunk_type from_string(std::string_view text);

        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const { return b; }

        [[nodiscard]] constexpr bool is_critical() const {
            return (b[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const {
            return (b[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (b[2] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (b[3] & property_bit) != 0;
        }

        [[nodiscard]] constexpr bool is_alphabetic() const {
            for (auto c : b) {
                if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'))) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] constexpr bool is_valid() const {
            return is_alphabetic() && is_reserved_bit_valid();
        }

        /**
         * @brief The four bytes as text
         * @return Empty string if the bytes are not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        constexpr bool operator==(const chunk_type& o) const { return b == o.b; }
        constexpr bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        // Stream output: quoted, non-printable bytes escaped
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            os << '\'';
            for (auto c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types, e.g. "IEND"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }

    // Well-known critical chunk types
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }

}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
