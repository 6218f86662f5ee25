#ifndef SGTYPES_H
#define SGTYPES_H

#include "config.h"

#include <string>
#include <string_view>
#include <cstdint>
#include <sys/types.h>

using namespace std::literals::string_view_literals;

namespace sgate
{

using mstring = std::string;
using cmstring = const std::string;
using string_view = std::string_view;
typedef const char* LPCSTR;
typedef std::string::size_type tStrPos;
const static tStrPos stmiss(std::string::npos);

#define WARN_UNUSED __attribute__((warn_unused_result))
#define __just_fall_through [[fallthrough]]

#ifndef _countof
#define _countof(x) (sizeof(x)/sizeof(x[0]))
#endif

#define AC_LIKELY(x) __builtin_expect(!!(x), true)
#define AC_UNLIKELY(x) __builtin_expect(!!(x), false)

}

#endif // SGTYPES_H
