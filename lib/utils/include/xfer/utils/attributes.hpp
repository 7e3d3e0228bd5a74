/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the inlining and branch-prediction hints used by the
  header scanners.
- Unifies spelling across MSVC, Clang, and GCC so call sites stay portable.

Provided Macros:
- XFER_FORCE_INLINE
- XFER_LIKELY(x), XFER_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// XFER_FORCE_INLINE
#if !defined(XFER_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define XFER_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define XFER_FORCE_INLINE inline __attribute__((always_inline))
#else
#define XFER_FORCE_INLINE inline
#endif
#else
#define XFER_FORCE_INLINE inline
#endif
#else
#define XFER_FORCE_INLINE inline
#endif

// XFER_LIKELY / XFER_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define XFER_LIKELY(x) (__builtin_expect(!!(x), 1))
#define XFER_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define XFER_LIKELY(x) (x)
#define XFER_UNLIKELY(x) (x)
#endif
