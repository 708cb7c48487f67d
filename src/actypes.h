#ifndef ACTYPES_H
#define ACTYPES_H

#include "config.h"

#include <string>
#include <string_view>
#include <limits>
#include <climits>
#include <cstdint>

#include <sys/types.h>

#define DLBR_API __attribute__ ((visibility ("default")))
#define WARN_UNUSED __attribute__ ((warn_unused_result))

#define MAX_VAL(x) std::numeric_limits<x>::max()
#define MIN_VAL(x) std::numeric_limits<x>::min()

#ifdef __GNUC__
#define AC_LIKELY(x)   __builtin_expect(!!(x), true)
#define AC_UNLIKELY(x) __builtin_expect(!!(x), false)
#else
#define AC_LIKELY(x)   x
#define AC_UNLIKELY(x) x
#endif

// unit tests may poke into the internals
#ifdef UNDER_TEST
#define SUTPROTECTED public
#define SUTPRIVATE public
#else
#define SUTPROTECTED protected
#define SUTPRIVATE private
#endif

namespace dlbr
{
using namespace std::literals;

typedef std::string mstring;
typedef const std::string cmstring;
typedef const char * LPCSTR;
using std::string_view;

typedef std::string::size_type tStrPos;
static constexpr tStrPos stmiss = std::string::npos;
}

#endif // ACTYPES_H
