//
// Hardening tests: hostile or malformed buffers
//

#include <doctest/doctest.h>
#include <limits>
#include <vector>

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::vector<std::uint8_t> signature_bytes() {
        return {container::signature.begin(), container::signature.end()};
    }
}

TEST_CASE("Security - huge declared lengths") {
    SUBCASE("length far beyond buffer") {
        auto bytes = signature_bytes();
        append_be32(bytes, 0x7FFFFFFFu);
        bytes.insert(bytes.end(), {'I', 'D', 'A', 'T', 0, 0, 0, 0});
        CHECK_THROWS_AS(container::decode(bytes), length_mismatch);
    }

    SUBCASE("maximum u32 length") {
        auto bytes = signature_bytes();
        append_be32(bytes, 0xFFFFFFFFu);
        bytes.insert(bytes.end(), {'I', 'D', 'A', 'T', 0, 0, 0, 0});
        CHECK_THROWS_AS(container::decode(bytes), length_mismatch);
    }

    SUBCASE("size limit is checked before the frame is read") {
        auto bytes = signature_bytes();
        append_be32(bytes, 10 * 1024 * 1024);
        bytes.insert(bytes.end(), {'I', 'D', 'A', 'T', 0, 0, 0, 0});

        parse_options opts;
        opts.max_chunk_size = 1024 * 1024;
        CHECK_THROWS_AS(container::decode(bytes, opts), chunk_too_large);
    }
}

TEST_CASE("Security - arbitrary bytes never crash the decoder") {
    // Deterministic pseudo-random garbage after a valid signature
    std::uint32_t state = 12345;
    auto next = [&state]() {
        state = state * 1103515245u + 12345u;
        return static_cast<std::uint8_t>(state >> 16);
    };

    for (int round = 0; round < 200; ++round) {
        auto bytes = signature_bytes();
        std::size_t size = next() % 64;
        for (std::size_t i = 0; i < size; ++i) {
            bytes.push_back(next());
        }
        CAPTURE(round);
        try {
            (void)container::decode(bytes);
        } catch (const parse_error&) {
            // Expected for almost every input
        }
    }
}

TEST_CASE("Security - every truncation of a valid file fails cleanly") {
    auto bytes = png_bytes({ihdr_chunk(), make_chunk("RuSt", "secret"), iend_chunk()});

    for (std::size_t len = 0; len < bytes.size(); ++len) {
        std::vector<std::uint8_t> cut(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(len));
        CAPTURE(len);
        bool at_boundary = len == 8 || len == 8 + 25 || len == 8 + 25 + 18;
        if (at_boundary) {
            // Ends between chunks: still a well-formed sequence
            CHECK_NOTHROW((void)container::decode(cut));
        } else {
            CHECK_THROWS_AS((void)container::decode(cut), parse_error);
        }
    }
}

TEST_CASE("Security - oversize payload is a programming error") {
    // Cannot allocate 4 GiB in a unit test; check the boundary constant instead
    CHECK(chunk::max_data_size == std::numeric_limits<std::uint32_t>::max());
    CHECK(chunk::min_frame_size == 12);
}
