#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>

#include "log.h"

static bool verbose = false;

void kilnSetVerbose(bool v)
{
	verbose = v;
}

bool kilnGetVerbose()
{
	return verbose;
}

void kilnLog(const char* fmt, ...)
{
	if (!verbose)
		return;

	va_list args;
	va_start(args,fmt);
	printf("kiln: ");
	vprintf(fmt,args);
	printf("\n");
	va_end(args);
}

void kilnWarn(const char* fmt, ...)
{
	va_list args;
	va_start(args,fmt);
	fprintf(stderr, "kiln: ");
	vfprintf(stderr, fmt, args);
	fprintf(stderr, "\n");
	va_end(args);
}

void kilnFatal(const char* fmt, ...)
{
	va_list args;
	va_start(args,fmt);
	fprintf(stderr, "kiln: fatal: ");
	vfprintf(stderr, fmt, args);
	fprintf(stderr, "\n");
	va_end(args);

	fflush(stdout);
	exit(1);
}
