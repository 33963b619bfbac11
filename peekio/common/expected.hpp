#pragma once

#include <expected>

namespace peekio {
using std::expected;
using std::unexpected;
} // namespace peekio
