// MatQSym copyright 2026 all rights reserved. MatQSym comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifdef MATQSYM_STDINC_GUARD
#error stdinc.h included twice. Only include stdinc.h once per cpp file.
#endif
#define MATQSYM_STDINC_GUARD

#if defined (__GNUC__) // GCC or Clang compiler

#define MATQSYM_NO_INLINE __attribute__((noinline))
#define MATQSYM_INLINE __attribute__((always_inline)) inline
#define MATQSYM_ASSUME(X)
#define MATQSYM_UNREACHABLE __builtin_unreachable()

#elif defined (_MSC_VER)

#define MATQSYM_NO_INLINE __declspec(noinline)
#define MATQSYM_INLINE __forceinline
#define MATQSYM_ASSUME(X) __assume(X)
#define MATQSYM_UNREACHABLE __assume(false)

#pragma warning (disable: 4996) // std::copy on pointers is flagged as dangerous
#pragma warning (disable: 4127) // Warns about using "while (true)".
#pragma warning (disable: 4100) // Warns about unused parameters.

#else

#define MATQSYM_NO_INLINE
#define MATQSYM_INLINE inline
#define MATQSYM_ASSUME(X)
#define MATQSYM_UNREACHABLE

#endif

#include <cstddef>
#include <memory>
#include <utility>

#ifdef MATQSYM_DEBUG
// don't force inline while debugging
#undef MATQSYM_INLINE
#define MATQSYM_INLINE inline

#include <iostream> // Useful for debugging.
#include <cassert>
#define MATQSYM_ASSERT(X) do{assert(X);}while(0)
#define MATQSYM_ASSERT_NO_ASSUME(X) MATQSYM_ASSERT(X)
#define MATQSYM_IF_DEBUG(X) X
#else
#define MATQSYM_ASSERT(X) MATQSYM_ASSUME(X)
#define MATQSYM_ASSERT_NO_ASSUME(X)
#define MATQSYM_IF_DEBUG(X)
#endif

#ifdef MATQSYM_SLOW_DEBUG
// for asserts that take a long time.
#define MATQSYM_SLOW_ASSERT(X) MATQSYM_ASSERT(X)
#else
#define MATQSYM_SLOW_ASSERT(X)
#endif

/// Concatenates A and B after macro expansion of both.
#define MATQSYM_CONCATENATE_AFTER_EXPANSION(A, B) MATQSYM_CONCATENATE(A, B)
#define MATQSYM_CONCATENATE(A, B) A##B

#define MATQSYM_NAMESPACE_BEGIN namespace mqs {
#define MATQSYM_NAMESPACE_END }

MATQSYM_NAMESPACE_BEGIN

/// C++11 has no std::make_unique. See http://herbsutter.com/gotw/_102/ for
/// a reason to have one anyway.
template<class T, class... Args>
std::unique_ptr<T> make_unique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

typedef unsigned long long uint64;
typedef unsigned int uint32;
typedef unsigned short uint16;
typedef unsigned char uint8;

typedef signed long long int64;
typedef signed int int32;
typedef signed short int16;
typedef signed char int8;

MATQSYM_NAMESPACE_END
