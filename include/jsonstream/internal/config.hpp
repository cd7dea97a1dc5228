// Config macros and platform support.

#ifndef JSONSTREAM_CONFIG_HPP
#define JSONSTREAM_CONFIG_HPP

// Maximum nesting depth of objects and arrays accepted by the tokenizer.
#ifndef JSONSTREAM_MAX_DEPTH
#define JSONSTREAM_MAX_DEPTH 512
#endif


#include <cstddef>
#include <cassert>
#include <cfloat>

#define JSONSTREAM_STRFY(...) #__VA_ARGS__
#define JSONSTREAM_XSTRFY(x) JSONSTREAM_STRFY(x)

#define JSONSTREAM_SRCLOC __FILE__ ":" JSONSTREAM_XSTRFY(__LINE__)

#ifdef __has_attribute
#define JSONSTREAM_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define JSONSTREAM_HAS_ATTRIBUTE(x) 0
#endif

#ifdef _MSC_VER
#define JSONSTREAM_NEVER_INLINE __declspec(noinline)
#elif JSONSTREAM_HAS_ATTRIBUTE(noinline)
#define JSONSTREAM_NEVER_INLINE __attribute__((noinline))
#else
#define JSONSTREAM_NEVER_INLINE
#endif


// Enable runtime asserts in library code.
//
// By default this is tied to NDEBUG, but you can change
// this by defining the macro yourself
// (if you want asserts in a Release build, for example)
//
// You can also provide a custom assert by defining JSONSTREAM_ASSERT().
//
#ifndef JSONSTREAM_USE_ASSERTS
#ifdef NDEBUG
#define JSONSTREAM_USE_ASSERTS 0
#else
#define JSONSTREAM_USE_ASSERTS 1
#endif
#endif

#if !defined(JSONSTREAM_ASSERT) && JSONSTREAM_USE_ASSERTS
#ifdef NDEBUG
#include <cstdio>
#include <exception>

namespace jsonstream {
namespace internal {
JSONSTREAM_NEVER_INLINE inline
void assert_fail(const char* src_loc, const char* msg)
{
    std::fprintf(stderr, "\n%s: Assertion '%s' failed.", src_loc, msg);
    std::terminate();
}
}}
#define JSONSTREAM_ASSERT(cond) \
(void)( \
    (!!(cond)) || \
    (::jsonstream::internal::assert_fail(JSONSTREAM_SRCLOC, #cond), 0) \
)
#else
#define JSONSTREAM_ASSERT(cond) assert(cond)
#endif
#elif !defined(JSONSTREAM_ASSERT)
#define JSONSTREAM_ASSERT(cond)
#endif

#endif
