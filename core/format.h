// SPDX-License-Identifier: GPL-2.0
#ifndef FORMAT_H
#define FORMAT_H

#ifdef __GNUC__
#define __printf(x, y) __attribute__((__format__(__printf__, x, y)))
#else
#define __printf(x, y)
#endif

#include <stdarg.h>
#include <string>

__printf(1, 2) std::string format_string_std(const char *fmt, ...);
__printf(1, 0) std::string vformat_string_std(const char *fmt, va_list ap);

#endif
