// SPDX-License-Identifier: GPL-2.0
#include "format.h"

#include <stdio.h>
#include <vector>

std::string vformat_string_std(const char *fmt, va_list ap)
{
	va_list ap2;
	va_copy(ap2, ap);
	int len = vsnprintf(nullptr, 0, fmt, ap2);
	va_end(ap2);
	if (len <= 0)
		return std::string();

	std::vector<char> buf(len + 1);
	vsnprintf(buf.data(), buf.size(), fmt, ap);
	return std::string(buf.data(), len);
}

std::string format_string_std(const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	std::string res = vformat_string_std(fmt, ap);
	va_end(ap);
	return res;
}
