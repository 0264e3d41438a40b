// sys.cpp created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "sys.h"

#include <sys/syscall.h>
#include <unistd.h>
#include <cstring>

namespace ambit::core {


int cpu_count()
{
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? int(n) : 1;
}


ThreadId get_thread_id()
{
    return (ThreadId) syscall(SYS_gettid);
}


std::string error_str(int errno_)
{
    char buffer[200];
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU variant may return static string instead of filling the buffer
    return strerror_r(errno_, buffer, sizeof buffer);
#else
    if (strerror_r(errno_, buffer, sizeof buffer) != 0)
        return "unknown error (" + std::to_string(errno_) + ')';
    return buffer;
#endif
}


}  // namespace ambit::core
