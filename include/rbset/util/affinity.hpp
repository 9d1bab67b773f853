#ifndef RBSET_UTIL_AFFINITY_HPP
#define RBSET_UTIL_AFFINITY_HPP

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#include <sched.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/thread_policy.h>
#include <pthread.h>
#endif

namespace rbset
{
namespace util
{

// Pins the calling thread to core `id`.  Returns false when the platform
// refuses or does not support it; callers treat pinning as a hint.
inline bool use_core(int id)
{
    if (id < 0) return false;

#ifdef _WIN32
    if (id >= static_cast<int>(sizeof(DWORD_PTR) * 8)) return false;
    HANDLE    thread = GetCurrentThread();
    DWORD_PTR mask   = static_cast<DWORD_PTR>(1) << id;
    return SetThreadAffinityMask(thread, mask) != 0;
#elif defined(__linux__)
    if (id >= CPU_SETSIZE) return false;
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#elif defined(__APPLE__)
    thread_affinity_policy_data_t policy = {id};
    return thread_policy_set(pthread_mach_thread_np(pthread_self()),
                             THREAD_AFFINITY_POLICY, (thread_policy_t)&policy, 1) == KERN_SUCCESS;
#else
    return false;
#endif
}

}  // namespace util
}  // namespace rbset

#endif  // RBSET_UTIL_AFFINITY_HPP
