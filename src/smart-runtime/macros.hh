#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: SR_COMPILER_MSVC, SR_COMPILER_CLANG, SR_COMPILER_GCC, SR_COMPILER_POSIX

#if defined(_MSC_VER)
#define SR_COMPILER_MSVC
#elif defined(__clang__)
#define SR_COMPILER_CLANG
#elif defined(__GNUC__)
#define SR_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(SR_COMPILER_CLANG) || defined(SR_COMPILER_GCC)
#define SR_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: SR_DEBUG, SR_RELEASE, SR_RELWITHDEBINFO and SR_ASSERT_ENABLED (0 or 1)

#ifndef SR_ASSERT_ENABLED
#define SR_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: SR_OS_WINDOWS, SR_OS_LINUX, SR_OS_APPLE, SR_OS_BSD, SR_OS_WASM

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define SR_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define SR_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define SR_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define SR_OS_BSD
#elif defined(__wasm__)
#define SR_OS_WASM
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// SR_FORCE_INLINE - Force function to be inlined
#define SR_FORCE_INLINE SR_IMPL_FORCE_INLINE

// SR_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: SR_COLD_FUNC void handle_error() { ... }
#define SR_COLD_FUNC SR_IMPL_COLD_FUNC

// SR_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
// Usage: default: SR_BUILTIN_UNREACHABLE;
#define SR_BUILTIN_UNREACHABLE SR_IMPL_BUILTIN_UNREACHABLE

// SR_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define SR_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(SR_COMPILER_MSVC)

#define SR_IMPL_FORCE_INLINE __forceinline
#define SR_IMPL_COLD_FUNC
#define SR_IMPL_BUILTIN_UNREACHABLE __assume(0)

#elif defined(SR_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define SR_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define SR_IMPL_COLD_FUNC __attribute__((cold))
#define SR_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#else
#error "Unknown compiler"
#endif
