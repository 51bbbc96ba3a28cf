/**
 * @file png_stash.cpp
 * @brief Hide, reveal and remove messages in PNG files
 *
 * This example drives the container API from the command line:
 * it appends a private chunk holding a message, prints messages
 * stored under a chunk type, removes such a chunk, or dumps the
 * whole chunk structure.
 */

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

    std::vector<std::uint8_t> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file '" + path + "'");
        }
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    void write_file(const std::string& path, const std::vector<std::uint8_t>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot create file '" + path + "'");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            throw std::runtime_error("Failed writing '" + path + "'");
        }
    }

    pngchunk::container load(const std::string& path) {
        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return pngchunk::container::decode(read_file(path), options);
    }

    void print_usage(const char* argv0) {
        std::cout << "Usage: " << argv0 << " <command> <file> [args]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk_type> <message> [output]\n";
        std::cout << "    Append a chunk holding message; prints the result if no output is given\n";
        std::cout << "  decode <file> <chunk_type>\n";
        std::cout << "    Print every message stored under chunk_type\n";
        std::cout << "  remove <file> <chunk_type> [output]\n";
        std::cout << "    Remove the first chunk of chunk_type; rewrites file if no output is given\n";
        std::cout << "  print <file>\n";
        std::cout << "    Dump the chunk structure\n";
        std::cout << "\n";
        std::cout << "Example:\n";
        std::cout << "  " << argv0 << " encode image.png ruSt \"meet at noon\" out.png\n";
    }

    int encode_message(const std::string& path, const std::string& type, const std::string& message,
                       const std::optional<std::string>& output) {
        auto png = load(path);
        png.append(pngchunk::chunk(pngchunk::chunk_type::from_string(type),
                                   std::vector<std::uint8_t>(message.begin(), message.end())));
        if (output) {
            write_file(*output, png.to_bytes());
        } else {
            std::cout << png;
        }
        return 0;
    }

    int decode_message(const std::string& path, const std::string& type) {
        auto png = load(path);
        auto wanted = pngchunk::chunk_type::from_string(type);
        auto found = png.chunks_by_type(wanted);
        if (found.empty()) {
            std::cerr << "No chunk found of type " << wanted << "\n";
            return 1;
        }

        for (const auto& c : found) {
            try {
                std::cout << c.data_as_string() << "\n";
            } catch (const pngchunk::utf8_decode_error&) {
                std::cout << "[Hex data]:";
                for (auto byte : c.data()) {
                    std::cout << " " << std::hex << static_cast<unsigned>(byte) << std::dec;
                }
                std::cout << "\n";
            }
        }
        return 0;
    }

    int remove_message(const std::string& path, const std::string& type, const std::optional<std::string>& output) {
        auto png = load(path);
        png.remove_first_of_type(pngchunk::chunk_type::from_string(type));
        write_file(output.value_or(path), png.to_bytes());
        return 0;
    }

    int print_structure(const std::string& path) {
        std::cout << load(path);
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string path = argv[2];

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            std::optional<std::string> output;
            if (argc == 6) {
                output = argv[5];
            }
            return encode_message(path, argv[3], argv[4], output);
        } else if (command == "decode" && argc == 4) {
            return decode_message(path, argv[3]);
        } else if (command == "remove" && (argc == 4 || argc == 5)) {
            std::optional<std::string> output;
            if (argc == 5) {
                output = argv[4];
            }
            return remove_message(path, argv[3], output);
        } else if (command == "print" && argc == 3) {
            return print_structure(path);
        }

        print_usage(argv[0]);
        return 1;

    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
