#pragma once

#include <string>
#include <string_view>

#if defined(__linux__)
#include <sys/prctl.h>
#else
#include <pthread.h>
#endif

// Kernel thread names are limited to 15 characters plus the terminator
inline void SetThreadName(std::string_view threadName)
{
    std::string name(threadName.substr(0, 15));
#if defined(__linux__)
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#elif defined(__APPLE__)
    pthread_setname_np(name.c_str());
#else
    pthread_setname_np(pthread_self(), name.c_str());
#endif
}
