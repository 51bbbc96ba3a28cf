/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk decoding
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding a PNG byte buffer
     *
     * Controls strictness, size limits and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk whose declared length exceeds max_chunk_size
         * fails the decode. When false, the chunk is accepted and a
         * "size_limit" warning is reported.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed declared chunk length in bytes
         *
         * Default is the largest value the 32-bit length field can hold.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @brief Report chunk types that fail chunk_type::is_valid()
         *
         * Such chunks are still decoded; only a warning is raised.
         */
        bool warn_on_invalid_types = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the chunk the warning is about
         * @param category Warning category (e.g., "size_limit", "after_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
