//
// PNG chunk frame encoding and decoding
//

#include <pngchunk/chunk.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

#include "input.hh"
#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_type(type), m_data(std::move(data)), m_crc(0) {
        if (m_data.size() > max_data_size) {
            throw std::length_error(build_error_msg(
                "Chunk data of ", m_data.size(), " bytes exceeds the maximum of ",
                max_data_size, " bytes"));
        }
        m_crc = compute_crc(m_type, m_data);
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc)
        : m_type(type), m_data(std::move(data)), m_crc(crc) {}

    std::uint32_t chunk::compute_crc(const chunk_type& type, std::span<const std::uint8_t> data) {
        // zlib's crc32 is CRC-32/ISO-HDLC, the PNG checksum
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.b.data(), static_cast<uInt>(type.b.size()));
        if (!data.empty()) {
            crc = crc32_z(crc, data.data(), static_cast<z_size_t>(data.size()));
        }
        return static_cast<std::uint32_t>(crc);
    }

    chunk chunk::decode(std::span<const std::uint8_t> bytes, std::uint64_t offset) {
        THROW_PNG_IF(bytes.size() < min_frame_size, truncated_chunk,
                     "Chunk at offset ", offset, " needs at least ", min_frame_size,
                     " bytes, only ", bytes.size(), " available");

        byte_reader in(bytes, offset);

        std::uint32_t declared = in.read_be32();
        chunk_type type = in.read_chunk_type();
        auto data = in.read_exact(in.remaining() - crc_field_size);

        THROW_PNG_IF(data.size() != declared, length_mismatch,
                     "Chunk ", type, " at offset ", offset, " declares ", declared,
                     " data bytes, but ", data.size(), " are present");

        std::uint32_t stored = in.read_be32();
        std::uint32_t computed = compute_crc(type, data);

        THROW_PNG_IF(stored != computed, crc_mismatch,
                     "Chunk ", type, " at offset ", offset, " has CRC 0x", std::hex,
                     std::setw(8), std::setfill('0'), stored, ", computed 0x",
                     std::setw(8), std::setfill('0'), computed);

        return chunk(type, std::vector<std::uint8_t>(data.begin(), data.end()), stored);
    }

    std::string chunk::data_as_string() const {
        THROW_PNG_UNLESS(is_valid_utf8(m_data), utf8_decode_error,
                         "Data of chunk ", m_type, " (", m_data.size(), " bytes) is not valid UTF-8");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::uint8_t> chunk::to_bytes() const {
        std::vector<std::uint8_t> out;
        out.reserve(frame_size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::uint8_t>& out) const {
        std::uint8_t field[4];

        store_be32(field, length());
        out.insert(out.end(), field, field + 4);

        out.insert(out.end(), m_type.b.begin(), m_type.b.end());
        out.insert(out.end(), m_data.begin(), m_data.end());

        store_be32(field, m_crc);
        out.insert(out.end(), field, field + 4);
    }

    std::string chunk::to_string() const {
        std::ostringstream os;
        os << *this;
        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Length: " << c.length() << "\n";
        os << "Chunk Type: " << c.type().to_string() << "\n";

        os << "Data (Bytes): [";
        bool first = true;
        for (auto byte : c.data()) {
            if (!first) {
                os << ", ";
            }
            os << static_cast<unsigned>(byte);
            first = false;
        }
        os << "]\n";

        // Best effort: one char per byte, non-printables escaped
        os << "Data (String): ";
        for (auto byte : c.data()) {
            if (byte >= 32 && byte <= 126) {
                os << static_cast<char>(byte);
            } else {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(byte);
                os.flags(flags);
                os.fill(fill);
            }
        }
        os << "\n";

        os << "CRC: " << c.crc() << "\n";
        return os;
    }

} // namespace pngchunk
