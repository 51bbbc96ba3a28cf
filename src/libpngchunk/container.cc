//
// PNG container: signature plus ordered chunk sequence
//

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>

#include "input.hh"

namespace pngchunk {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    container::container(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {}

    container container::decode(std::span<const std::uint8_t> bytes, const parse_options& options) {
        THROW_PNG_UNLESS(bytes.size() >= signature.size() &&
                         std::equal(signature.begin(), signature.end(), bytes.begin()),
                         bad_signature,
                         "Buffer of ", bytes.size(), " bytes does not start with the PNG signature");

        byte_reader in(bytes);
        in.skip(signature.size());

        std::vector<chunk> chunks;
        bool seen_iend = false;

        while (!in.at_end()) {
            std::uint64_t start = in.absolute_offset();

            THROW_PNG_IF(in.remaining() < chunk::min_frame_size, truncated_chunk,
                         "Chunk at offset ", start, " needs at least ", chunk::min_frame_size,
                         " bytes, only ", in.remaining(), " remain");

            std::uint64_t declared = in.peek_be32();

            if (declared > options.max_chunk_size) {
                if (options.strict) {
                    THROW_PNG(chunk_too_large,
                              "Chunk at offset ", start, " has size ", declared,
                              " bytes, which exceeds maximum allowed size of ",
                              options.max_chunk_size, " bytes");
                }
                warn(options, start, "size_limit",
                     build_error_msg("Chunk size ", declared, " exceeds maximum ",
                                     options.max_chunk_size, ", accepting in lenient mode"));
            }

            std::uint64_t frame = chunk::min_frame_size + declared;
            THROW_PNG_IF(frame > in.remaining(), length_mismatch,
                         "Chunk at offset ", start, " declares ", declared,
                         " data bytes, but only ", in.remaining() - chunk::min_frame_size,
                         " remain in the buffer");

            chunk c = chunk::decode(in.read_exact(static_cast<std::size_t>(frame)), start);

            if (options.warn_on_invalid_types && !c.type().is_valid()) {
                warn(options, start, "invalid_chunk_type",
                     build_error_msg("Chunk type ", c.type(), " is not a valid PNG chunk type"));
            }
            if (seen_iend) {
                warn(options, start, "after_iend",
                     build_error_msg("Chunk ", c.type(), " follows IEND"));
            }
            if (c.type() == chunk_types::IEND) {
                seen_iend = true;
            }

            chunks.push_back(std::move(c));
        }

        if (chunks.empty() || chunks.back().type() != chunk_types::IEND) {
            warn(options, in.absolute_offset(), "missing_iend",
                 "Chunk sequence does not end with IEND");
        }

        return container(std::move(chunks));
    }

    std::vector<chunk> container::chunks_by_type(const chunk_type& type) const {
        std::vector<chunk> result;
        std::copy_if(m_chunks.begin(), m_chunks.end(), std::back_inserter(result),
                     [&type](const chunk& c) { return c.type() == type; });
        return result;
    }

    std::optional<std::size_t> container::first_matching_index(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        if (it == m_chunks.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - m_chunks.begin());
    }

    chunk container::remove_first_of_type(const chunk_type& type) {
        auto index = first_matching_index(type);
        THROW_PNG_UNLESS(index.has_value(), chunk_not_found,
                         "No chunk of type ", type, " among ", m_chunks.size(), " chunks");

        auto pos = m_chunks.begin() + static_cast<std::ptrdiff_t>(*index);
        chunk removed = std::move(*pos);
        m_chunks.erase(pos);
        return removed;
    }

    void container::append(chunk c, append_policy policy) {
        if (policy == append_policy::before_iend &&
            !m_chunks.empty() && m_chunks.back().type() == chunk_types::IEND) {
            m_chunks.insert(m_chunks.end() - 1, std::move(c));
            return;
        }
        m_chunks.push_back(std::move(c));
    }

    std::vector<std::uint8_t> container::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.frame_size();
        }

        std::vector<std::uint8_t> out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    std::string container::to_string() const {
        std::ostringstream os;
        os << *this;
        return os.str();
    }

    std::ostream& operator<<(std::ostream& os, const container& c) {
        os << "Signature: [";
        for (std::size_t i = 0; i < container::signature.size(); ++i) {
            if (i != 0) {
                os << ", ";
            }
            os << static_cast<unsigned>(container::signature[i]);
        }
        os << "]\n";

        for (const auto& ch : c.chunks()) {
            os << "\n" << ch;
        }
        return os;
    }

} // namespace pngchunk
