#include "thread_utils.hpp"

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

namespace remote_pager {

void SetThreadName(const std::string &thread_name) {
#if defined(__APPLE__)
	pthread_setname_np(thread_name.c_str());
#elif defined(__linux__)
	// Restricted to 16 characters, include terminator.
	pthread_setname_np(pthread_self(), thread_name.substr(0, 15).c_str());
#endif
}

} // namespace remote_pager
