#pragma once

#include <cstdint>
#include <functional>

namespace ferry::protocols {

// (bytes written so far, total bytes)
using ProgressFn = std::function<void(uintmax_t, uintmax_t)>;

// Polled between chunks; true aborts the transfer with an Interrupted error.
using CancelFn = std::function<bool()>;

}
