#pragma once

#include "peekio/net/uv_source.hpp"
