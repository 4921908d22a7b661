#pragma once
// Best-effort pinning of the calling thread to one core; a no-op where unsupported.
#if defined(_WIN32)
#  include <windows.h>
#elif defined(__linux__)
#  include <pthread.h>
#  include <sched.h>
#endif

namespace minhash {

#if defined(_WIN32)
inline void pin_current_thread_to_core(unsigned i){
  DWORD_PTR mask = (1ULL << i);
  SetThreadAffinityMask(GetCurrentThread(), mask);
}
#elif defined(__linux__)
inline void pin_current_thread_to_core(unsigned i){
  cpu_set_t set;
  CPU_ZERO(&set);
  CPU_SET(i % CPU_SETSIZE, &set);
  // A refused mask leaves the thread where the scheduler put it.
  (void)pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
}
#else
inline void pin_current_thread_to_core(unsigned) {}
#endif

} // namespace minhash
