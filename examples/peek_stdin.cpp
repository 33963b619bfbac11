// Sniffs the content type of standard input from its first bytes, then
// counts the rest of the stream:
//
//   cat image.png | peek_stdin [chunk_size]
#include "peekio/core.hpp"
#include "peekio/io.hpp"
#include "peekio/net.hpp"

#include <array>
#include <charconv>
#include <string_view>
#include <vector>

using namespace peekio;
using namespace peekio::io;
using namespace peekio::net;

namespace {

struct Magic {
    std::string_view prefix;
    std::string_view name;
};

constexpr std::array<Magic, 7> magics{{
    {"\x89PNG", "png image"},
    {"GIF8", "gif image"},
    {"%PDF", "pdf document"},
    {"PK\x03\x04", "zip archive"},
    {"\x1f\x8b", "gzip stream"},
    {"\x7f" "ELF", "elf binary"},
    {"#!", "script"},
}};

auto sniff(std::string_view head) -> std::string_view {
    for (const auto &magic : magics) {
        if (head.starts_with(magic.prefix)) {
            return magic.name;
        }
    }
    return "unknown";
}

auto process(std::size_t chunk_size) -> Task<> {
    auto source = open_pipe(0);
    if (!source) {
        console.error("Can not read stdin: {}", source.error().message());
        co_return;
    }
    StreamReader reader{*source.value()};

    std::array<char, 4> head{};
    auto                peeked = co_await reader.peek(head);
    if (!peeked) {
        console.warn("Empty input: {}", peeked.error().message());
        co_return;
    }
    console.info("Content: {}",
                 sniff(std::string_view{head.data(), peeked.value()}));

    std::vector<char> buf(chunk_size);
    std::size_t       total = 0;
    while (true) {
        auto ret = co_await reader.read(buf);
        if (!ret) {
            if (ret.error() != make_peekio_error(Error::EndOfStream)) {
                console.error("Read failed: {}", ret.error().message());
            }
            break;
        }
        total += ret.value();
    }
    console.info("Total: {} bytes", total);
}

auto parse_chunk_size(int argc, char **argv) -> std::size_t {
    std::size_t chunk_size = 4096;
    if (argc > 1) {
        std::string_view arg{argv[1]};
        auto [ptr, ec]
            = std::from_chars(arg.data(), arg.data() + arg.size(), chunk_size);
        if (ec != std::errc{} || ptr != arg.data() + arg.size()
            || chunk_size == 0) {
            console.warn("Invalid chunk size `{}`, using 4096", arg);
            chunk_size = 4096;
        }
    }
    return chunk_size;
}

} // namespace

auto main(int argc, char **argv) -> int {
    SET_LOG_LEVEL(LogLevel::INFO);
    block_on(process(parse_chunk_size(argc, argv)));
}
