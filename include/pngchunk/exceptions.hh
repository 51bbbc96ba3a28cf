/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Closed set of failure kinds reported by the library
     *
     * Every exception in the hierarchy carries exactly one of these,
     * so callers may either catch by class or switch on kind().
     */
    enum class error_kind {
        bad_signature,       ///< Buffer does not start with the PNG signature
        truncated_chunk,     ///< Fewer than 12 bytes left for a chunk frame
        length_mismatch,     ///< Declared length differs from the data present
        crc_mismatch,        ///< Stored CRC differs from the recomputed one
        chunk_too_large,     ///< Declared length exceeds parse_options::max_chunk_size
        invalid_chunk_type,  ///< Text is not exactly four ASCII letters
        chunk_not_found,     ///< No chunk of the requested type
        utf8_decode_failure  ///< Chunk data is not valid UTF-8
    };

    /**
     * @brief Short stable name of an error kind, e.g. "crc_mismatch"
     */
    constexpr const char* to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::bad_signature:
                return "bad_signature";
            case error_kind::truncated_chunk:
                return "truncated_chunk";
            case error_kind::length_mismatch:
                return "length_mismatch";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::chunk_too_large:
                return "chunk_too_large";
            case error_kind::invalid_chunk_type:
                return "invalid_chunk_type";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
            case error_kind::utf8_decode_failure:
                return "utf8_decode_failure";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every library-specific error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class parse_error
     * @brief Base for structural corruption found while decoding bytes
     *
     * A decode that throws a parse_error produced no container or chunk.
     */
    class parse_error : public pngchunk_error {
    public:
        using pngchunk_error::pngchunk_error;
    };

    class bad_signature : public parse_error {
    public:
        explicit bad_signature(const std::string& msg)
            : parse_error(error_kind::bad_signature, msg) {}
    };

    class truncated_chunk : public parse_error {
    public:
        explicit truncated_chunk(const std::string& msg)
            : parse_error(error_kind::truncated_chunk, msg) {}
    };

    class length_mismatch : public parse_error {
    public:
        explicit length_mismatch(const std::string& msg)
            : parse_error(error_kind::length_mismatch, msg) {}
    };

    class crc_mismatch : public parse_error {
    public:
        explicit crc_mismatch(const std::string& msg)
            : parse_error(error_kind::crc_mismatch, msg) {}
    };

    class chunk_too_large : public parse_error {
    public:
        explicit chunk_too_large(const std::string& msg)
            : parse_error(error_kind::chunk_too_large, msg) {}
    };

    /**
     * @class invalid_chunk_type
     * @brief Thrown by chunk_type::from_string for malformed text
     */
    class invalid_chunk_type : public pngchunk_error {
    public:
        explicit invalid_chunk_type(const std::string& msg)
            : pngchunk_error(error_kind::invalid_chunk_type, msg) {}
    };

    /**
     * @class chunk_not_found
     * @brief Thrown when a lookup by type has no match
     *
     * This is a lookup failure, not corruption; it does not derive
     * from parse_error.
     */
    class chunk_not_found : public pngchunk_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : pngchunk_error(error_kind::chunk_not_found, msg) {}
    };

    class utf8_decode_error : public pngchunk_error {
    public:
        explicit utf8_decode_error(const std::string& msg)
            : pngchunk_error(error_kind::utf8_decode_failure, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PNG
     * @brief Throw the given exception type with a formatted message
     * @param type Exception class from the pngchunk hierarchy
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PNG(type, ...) \
        throw type(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PNG_IF
     * @brief Conditionally throw the given exception type
     */
    #define THROW_PNG_IF(condition, type, ...) \
        do { if (condition) THROW_PNG(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PNG_UNLESS
     * @brief Throw the given exception type unless condition is true
     */
    #define THROW_PNG_UNLESS(condition, type, ...) \
        do { if (!(condition)) THROW_PNG(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
