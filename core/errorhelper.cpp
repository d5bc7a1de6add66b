// SPDX-License-Identifier: GPL-2.0
#include "errorhelper.h"
#include "format.h"

#include <stdarg.h>
#include <stdio.h>

int verbose;

static void (*error_cb)(std::string) = NULL;

// All diagnostics end up on stderr, one line each
static void log_line(const char *level, const std::string &msg)
{
	fprintf(stderr, "%s: %s\n", level, msg.c_str());
}

void report_info(const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	log_line("INFO", vformat_string_std(fmt, args));
	va_end(args);
}

void report_verbose(const char *fmt, ...)
{
	if (!verbose)
		return;
	va_list args;
	va_start(args, fmt);
	log_line("DEBUG", vformat_string_std(fmt, args));
	va_end(args);
}

int report_error(const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	std::string msg = vformat_string_std(fmt, args);
	va_end(args);

	log_line("ERROR", msg);
	if (error_cb)
		error_cb(std::move(msg));
	return -1;
}

void set_error_cb(void(*cb)(std::string))
{
	error_cb = cb;
}
