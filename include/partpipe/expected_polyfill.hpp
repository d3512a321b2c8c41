#pragma once

// Unified include for std::expected (C++23).
// The build requires a standard library that ships <expected>.

#if defined(__has_include)
#  if !__has_include(<expected>)
#    error "partpipe requires a C++23 standard library providing <expected>"
#  endif
#endif
#include <expected>
