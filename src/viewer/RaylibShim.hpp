#pragma once

// Include raylib through this header only.
//
// Some toolchains reject <raylib.h> when it is seen before <cstdio>/<cstdarg>
// (TraceLogCallback uses va_list), so those come first.

#include <cstdarg>
#include <cstdio>

#include <raylib.h>
