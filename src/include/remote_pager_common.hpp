// Declarations shared by every remote_pager translation unit.

#pragma once

#include "duckdb/common/common.hpp"

namespace remote_pager {

// Container aliases, smart pointers, [idx_t] and exception types are taken from duckdb, so code reads the same way
// inside and outside of the extension.
using namespace duckdb; // NOLINT

} // namespace remote_pager
