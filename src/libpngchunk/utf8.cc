//
// UTF-8 well-formedness check
//

#include "utf8.hh"

namespace pngchunk {

    bool is_valid_utf8(std::span<const std::uint8_t> data) {
        std::size_t i = 0;
        const std::size_t n = data.size();

        while (i < n) {
            std::uint8_t c = data[i];

            if (c < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;

            if (c >= 0xC2 && c <= 0xDF) {
                extra = 1;
            } else if (c >= 0xE0 && c <= 0xEF) {
                extra = 2;
                if (c == 0xE0) {
                    lo = 0xA0;  // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;  // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                extra = 3;
                if (c == 0xF0) {
                    lo = 0x90;  // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;  // above U+10FFFF
                }
            } else {
                return false;
            }

            if (n - i <= extra) {
                return false;
            }

            // Only the first continuation byte has a narrowed range
            std::uint8_t next = data[i + 1];
            if (next < lo || next > hi) {
                return false;
            }
            for (std::size_t k = 2; k <= extra; ++k) {
                std::uint8_t cont = data[i + k];
                if (cont < 0x80 || cont > 0xBF) {
                    return false;
                }
            }

            i += extra + 1;
        }

        return true;
    }
}
