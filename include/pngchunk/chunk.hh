/**
 * @file chunk.hh
 * @brief Length-prefixed, CRC-protected PNG chunk
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief A single PNG chunk: type, opaque data and CRC
     *
     * Frame layout (big-endian):
     * @code
     *   length(4) | type(4) | data(length) | crc(4)
     * @endcode
     * The CRC is CRC-32/ISO-HDLC over the type bytes followed by the data.
     *
     * A chunk never changes after construction, so length() and crc()
     * always agree with type() and data().
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = 4;
        static constexpr std::size_t crc_field_size = 4;
        /// Smallest possible frame: a chunk with no data
        static constexpr std::size_t min_frame_size =
            length_field_size + type_field_size + crc_field_size;
        static constexpr std::uint64_t max_data_size = 0xFFFFFFFFu;

        /**
         * @brief Build a chunk and compute its length and CRC
         * @throws std::length_error if data does not fit a 32-bit length field
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /**
         * @brief Decode a buffer holding exactly one chunk frame
         * @param bytes The frame; its size defines where data ends
         * @param offset Position of the frame in an enclosing buffer,
         *        used only in error messages
         * @throws truncated_chunk if bytes is shorter than 12
         * @throws length_mismatch if the declared length differs from the data size
         * @throws crc_mismatch if the stored CRC differs from the computed one
         */
        static chunk decode(std::span<const std::uint8_t> bytes, std::uint64_t offset = 0);

        /**
         * @brief CRC-32/ISO-HDLC over type bytes followed by data
         */
        static std::uint32_t compute_crc(const chunk_type& type, std::span<const std::uint8_t> data);

        [[nodiscard]] std::uint32_t length() const {
            return static_cast<std::uint32_t>(m_data.size());
        }

        [[nodiscard]] const chunk_type& type() const { return m_type; }

        [[nodiscard]] std::span<const std::uint8_t> data() const { return m_data; }

        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Data interpreted as UTF-8 text
         * @throws utf8_decode_error if data is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Total number of bytes to_bytes() produces
        [[nodiscard]] std::size_t frame_size() const {
            return min_frame_size + m_data.size();
        }

        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        // Append the serialized frame to out
        void write_to(std::vector<std::uint8_t>& out) const;

        /**
         * @brief Multi-line diagnostic rendering
         *
         * Not a persistence format.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        // Used by decode() once the stored CRC has been verified
        chunk(chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc);

        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
