#pragma once

#include <string>

namespace remote_pager {

// Set the name for current thread, truncated to platform limit.
void SetThreadName(const std::string &thread_name);

} // namespace remote_pager
