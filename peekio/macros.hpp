#pragma once

#define REMEMBER_CO_AWAIT nodiscard("Did you forget to co_await?")
