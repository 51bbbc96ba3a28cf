#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("canonical vector") {
            auto c = chunk(chunk_type::from_string("RuSt"), bytes_of(secret_message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_crc);
            CHECK(c.type().to_string() == "RuSt");
        }

        SUBCASE("empty data") {
            auto c = iend_chunk();
            CHECK(c.length() == 0);
            CHECK(c.data().empty());
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.frame_size() == 12);
        }

        SUBCASE("compute_crc matches construction") {
            auto data = bytes_of(secret_message);
            CHECK(chunk::compute_crc("RuSt"_ct, data) == secret_crc);
        }
    }

    TEST_CASE("chunk decoding") {
        SUBCASE("valid frame") {
            auto c = chunk::decode(secret_frame());
            CHECK(c.length() == 42);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.data_as_string() == secret_message);
            CHECK(c.crc() == secret_crc);
            CHECK(c == chunk(chunk_type::from_string("RuSt"), bytes_of(secret_message)));
        }

        SUBCASE("wrong crc") {
            auto frame = make_frame(42, "RuSt", bytes_of(secret_message), secret_crc - 1);
            CHECK_THROWS_AS(chunk::decode(frame), crc_mismatch);
        }

        SUBCASE("zero length frame") {
            auto frame = iend_chunk().to_bytes();
            REQUIRE(frame.size() == 12);
            auto c = chunk::decode(frame);
            CHECK(c.type() == chunk_types::IEND);
            CHECK(c.length() == 0);
        }

        SUBCASE("fewer than 12 bytes") {
            std::vector<std::uint8_t> frame(11, 0);
            CHECK_THROWS_AS(chunk::decode(frame), truncated_chunk);
            CHECK_THROWS_AS(chunk::decode(std::span<const std::uint8_t>{}), truncated_chunk);
        }

        SUBCASE("type is not validated") {
            std::vector<std::uint8_t> data{1, 2, 3};
            unsigned char raw[4] = {'1', 0x00, '#', 'z'};
            auto type = chunk_type::from_bytes(raw);
            auto frame = chunk(type, data).to_bytes();

            auto c = chunk::decode(frame);
            CHECK(c.type() == type);
            CHECK_FALSE(c.type().is_valid());
        }
    }

    TEST_CASE("chunk round trip") {
        std::vector<std::vector<std::uint8_t>> payloads{
            {},
            {0},
            {0xFF, 0x00, 0x80},
            bytes_of(secret_message),
            std::vector<std::uint8_t>(70000, 0x5A)
        };

        for (const auto& payload : payloads) {
            auto original = chunk("ruSt"_ct, payload);
            auto decoded = chunk::decode(original.to_bytes());
            CAPTURE(payload.size());
            CHECK(decoded.length() == original.length());
            CHECK(decoded.type() == original.type());
            CHECK(decoded.crc() == original.crc());
            CHECK(decoded == original);
        }
    }

    TEST_CASE("chunk crc sensitivity") {
        const auto frame = secret_frame();

        // Every bit of the type and data region, stored CRC left alone
        for (std::size_t byte = 4; byte < frame.size() - 4; ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                auto corrupted = frame;
                corrupted[byte] ^= static_cast<std::uint8_t>(1u << bit);
                CAPTURE(byte);
                CAPTURE(bit);
                CHECK_THROWS_AS(chunk::decode(corrupted), crc_mismatch);
            }
        }
    }

    TEST_CASE("chunk length enforcement") {
        auto data = bytes_of(secret_message);
        for (std::uint32_t declared : {0u, 1u, 41u, 43u, 100u, 0xFFFFFFFFu}) {
            auto frame = make_frame(declared, "RuSt", data, secret_crc);
            CAPTURE(declared);
            CHECK_THROWS_AS(chunk::decode(frame), length_mismatch);
        }
    }

    TEST_CASE("chunk serialization layout") {
        auto c = chunk(chunk_type::from_string("RuSt"), bytes_of(secret_message));
        auto bytes = c.to_bytes();

        CHECK(bytes == secret_frame());
        REQUIRE(bytes.size() == 54);
        CHECK(bytes[0] == 0);
        CHECK(bytes[3] == 42);
        CHECK(bytes[4] == 'R');
        CHECK(bytes[7] == 't');
        // 2882656334 == 0xABD1D84E
        CHECK(bytes[50] == 0xAB);
        CHECK(bytes[51] == 0xD1);
        CHECK(bytes[52] == 0xD8);
        CHECK(bytes[53] == 0x4E);

        std::vector<std::uint8_t> out{0xEE};
        c.write_to(out);
        CHECK(out.size() == 55);
        CHECK(out[0] == 0xEE);
    }

    TEST_CASE("chunk data as string") {
        SUBCASE("valid utf-8") {
            auto c = make_chunk("tEXt", "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
            CHECK(c.data_as_string() == "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("empty data") {
            CHECK(iend_chunk().data_as_string().empty());
        }

        SUBCASE("invalid utf-8") {
            std::vector<std::vector<std::uint8_t>> bad{
                {0xFF},
                {0xC3},                    // truncated sequence
                {0xC0, 0x80},              // overlong NUL
                {0xE0, 0x80, 0x80},        // overlong
                {0xED, 0xA0, 0x80},        // surrogate
                {0xF4, 0x90, 0x80, 0x80},  // above U+10FFFF
                {'a', 0x80, 'b'}           // stray continuation
            };
            for (const auto& data : bad) {
                auto c = chunk("tEXt"_ct, data);
                CAPTURE(data.size());
                CHECK_THROWS_AS((void)c.data_as_string(), utf8_decode_error);
            }
        }
    }

    TEST_CASE("chunk rendering") {
        auto c = chunk(chunk_type::from_string("RuSt"), bytes_of("Hi\n"));
        auto text = c.to_string();

        CHECK(text.find("Length: 3") != std::string::npos);
        CHECK(text.find("Chunk Type: RuSt") != std::string::npos);
        CHECK(text.find("Data (Bytes): [72, 105, 10]") != std::string::npos);
        CHECK(text.find("Data (String): Hi\\x0a") != std::string::npos);
        CHECK(text.find("CRC: " + std::to_string(c.crc())) != std::string::npos);

        std::ostringstream os;
        os << c;
        CHECK(os.str() == text);
    }
}
