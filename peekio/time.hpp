#pragma once

#include "peekio/time/sleep.hpp"
