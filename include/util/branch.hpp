#pragma once

// Branch prediction hints for loops that run on every probe or log line.
// Safe no-ops on compilers that don't support __builtin_expect.
#if defined(__GNUC__) || defined(__clang__)
#define CONTROLROOM_LIKELY(x) (__builtin_expect(!!(x), 1))
#define CONTROLROOM_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define CONTROLROOM_LIKELY(x) (x)
#define CONTROLROOM_UNLIKELY(x) (x)
#endif
