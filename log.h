#pragma once

void kilnSetVerbose(bool verbose);
bool kilnGetVerbose();

void kilnLog(const char* fmt, ...);   // stdout, only when verbose
void kilnWarn(const char* fmt, ...);  // stderr, always
void kilnFatal(const char* fmt, ...); // stderr, then exit(1)
