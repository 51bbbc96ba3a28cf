//
// Bounds-checked reader over an in-memory byte buffer
//

#include "input.hh"

namespace pngchunk {

    std::span<const std::uint8_t> byte_reader::read_exact(std::size_t size) {
        THROW_PNG_IF(size > remaining(), truncated_chunk,
                     "Unexpected end of data at offset ", absolute_offset(),
                     ": requested ", size, " bytes, only ", remaining(), " available");
        auto result = m_data.subspan(m_position, size);
        m_position += size;
        return result;
    }

    std::uint32_t byte_reader::read_be32() {
        auto bytes = read_exact(4);
        return load_be32(bytes.data());
    }

    chunk_type byte_reader::read_chunk_type() {
        auto bytes = read_exact(4);
        return chunk_type::from_bytes(bytes.data());
    }

    std::uint32_t byte_reader::peek_be32() const {
        THROW_PNG_IF(remaining() < 4, truncated_chunk,
                     "Unexpected end of data at offset ", absolute_offset(),
                     ": need 4 bytes, only ", remaining(), " available");
        return load_be32(m_data.data() + m_position);
    }

    void byte_reader::skip(std::size_t size) {
        read_exact(size);
    }
}
