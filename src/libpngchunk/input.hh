//
// Bounds-checked reader over an in-memory byte buffer
//

#pragma once

#include <cstdint>
#include <span>

#include <pngchunk/exceptions.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Reads fields front to back. Any read past the end throws
    // truncated_chunk; the reader itself never owns the bytes.
    class byte_reader {
        public:
            // base_offset is added to positions reported in error messages
            explicit byte_reader(std::span<const std::uint8_t> data, std::uint64_t base_offset = 0)
                : m_data(data), m_base(base_offset), m_position(0) {}

            std::span<const std::uint8_t> read_exact(std::size_t size);
            std::uint32_t read_be32();
            chunk_type read_chunk_type();

            // Look at a big-endian u32 without consuming it
            [[nodiscard]] std::uint32_t peek_be32() const;

            void skip(std::size_t size);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t absolute_offset() const { return m_base + m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_data.size() - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_data.size(); }

        private:
            std::span<const std::uint8_t> m_data;
            std::uint64_t m_base;
            std::size_t m_position;
    };
}
