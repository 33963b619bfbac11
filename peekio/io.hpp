#pragma once

#include "peekio/io/byte_source.hpp"
#include "peekio/io/peek_buffer.hpp"
#include "peekio/io/push_source.hpp"
#include "peekio/io/stream_reader.hpp"
