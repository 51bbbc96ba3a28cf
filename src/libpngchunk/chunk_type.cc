//
// PNG chunk type parsing and rendering
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include "utf8.hh"

namespace pngchunk {

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_PNG_IF(text.size() != 4, invalid_chunk_type,
                     "Chunk type must be exactly 4 bytes, got ", text.size(), " in \"", text, "\"");

        chunk_type result;
        for (std::size_t i = 0; i < 4; ++i) {
            auto c = static_cast<std::uint8_t>(text[i]);
            THROW_PNG_UNLESS((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'), invalid_chunk_type,
                             "Chunk type \"", text, "\" has a non-letter byte at position ", i);
            result.b[i] = c;
        }
        return result;
    }

    std::string chunk_type::to_string() const {
        if (!is_valid_utf8(b)) {
            return {};
        }
        return {reinterpret_cast<const char*>(b.data()), b.size()};
    }

} // namespace pngchunk
