//
// UTF-8 well-formedness check
//

#pragma once

#include <cstdint>
#include <span>

namespace pngchunk {

    // True if data is well-formed UTF-8: no overlong forms, no surrogates,
    // nothing above U+10FFFF. Empty input is valid.
    bool is_valid_utf8(std::span<const std::uint8_t> data);
}
