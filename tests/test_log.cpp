#include "peekio/log.hpp"

using namespace peekio::log;

auto main() -> int {
    console.info("{:*^20}", "[log]");
    console.set_level(LogLevel::TRACE);
    console.trace("hello world");
    console.debug("hello world");
    console.info("hello world");
    console.warn("hello world");
    console.error("hello world");

    console.set_level(LogLevel::WARN);
    console.info("filtered out");
    console.warn("level={}", to_string(console.level()));
}
