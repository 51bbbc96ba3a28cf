/**
 * @file container.hh
 * @brief Ordered chunk sequence behind the PNG signature
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @enum append_policy
     * @brief Where container::append() places a new chunk
     */
    enum class append_policy {
        at_end,      ///< Always push to the end of the sequence
        before_iend  ///< Insert before a trailing IEND chunk, if there is one
    };

    /**
     * @class container
     * @brief In-memory model of a PNG file's chunk structure
     *
     * Holds the chunks in file order. Order is preserved across
     * decode()/to_bytes() and is significant for first-match lookups.
     * Chunks themselves are immutable; all mutation is adding or
     * removing whole chunks.
     */
    class PNGCHUNK_EXPORT container {
    public:
        static constexpr std::array<std::uint8_t, 8> signature{
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        container() = default;
        explicit container(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG byte buffer
         *
         * Decoding is all-or-nothing: the first bad chunk aborts and
         * the exception propagates unchanged.
         *
         * @throws bad_signature if bytes does not begin with the signature
         * @throws truncated_chunk if fewer than 12 bytes remain for a chunk
         * @throws length_mismatch if a declared length runs past the buffer
         * @throws crc_mismatch if a stored CRC is wrong
         * @throws chunk_too_large in strict mode, for lengths above the limit
         */
        static container decode(std::span<const std::uint8_t> bytes, const parse_options& options);

        static container decode(std::span<const std::uint8_t> bytes) {
            return decode(bytes, parse_options{});
        }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        /**
         * @brief All chunks of the given type, in sequence order
         *
         * No match is not an error; the result is simply empty.
         */
        [[nodiscard]] std::vector<chunk> chunks_by_type(const chunk_type& type) const;

        [[nodiscard]] std::optional<std::size_t> first_matching_index(const chunk_type& type) const;

        /**
         * @brief Remove the earliest chunk of the given type
         * @return The removed chunk
         * @throws chunk_not_found if no chunk has that type
         */
        chunk remove_first_of_type(const chunk_type& type);

        void append(chunk c, append_policy policy = append_policy::at_end);

        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        // Diagnostic rendering: signature followed by every chunk
        [[nodiscard]] std::string to_string() const;

    private:
        std::vector<chunk> m_chunks;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const container& c);

} // namespace pngchunk
