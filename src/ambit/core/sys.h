// sys.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_SYS_H
#define AMBIT_CORE_SYS_H

#include <string>
#include <cerrno>
#include <ctime>

#include <sys/types.h>

namespace ambit::core {


// Get number of CPUs (online processors).
int cpu_count();


/// Convenience wrapper around localtime_r
inline std::tm localtime(std::time_t t)
{
    std::tm r {};
    localtime_r(&t, &r);
    return r;
}


using ThreadId = pid_t;

/// Get integral thread ID of this thread
///
/// Unlike `std::this_thread::get_id()`, which is opaque and prints as
/// a pointer value, this returns the system-wide TID (same as shown by `top -H`).
/// Used by logger to tell apart messages from resolver worker threads.
ThreadId get_thread_id();


/// Returns error message for `errno_`.
/// Calls a thread-safe variant of strerror.
std::string error_str(int errno_ = errno);

}  // namespace ambit::core

#endif // AMBIT_CORE_SYS_H
