#pragma once

#include "peekio/common/result.hpp"
#include "peekio/coroutine/future.hpp"
#include "peekio/coroutine/task.hpp"
#include "peekio/log.hpp"
#include "peekio/runtime.hpp"
