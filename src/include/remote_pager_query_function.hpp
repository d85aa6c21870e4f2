// Table functions which expose remote pager status.

#pragma once

#include "duckdb/function/table_function.hpp"
#include "remote_pager_common.hpp"

namespace remote_pager {

// Get the table function to query resident pages.
TableFunction GetCacheStatusQueryFunc();

// Get the table function to query page cache access counters.
TableFunction GetCacheAccessInfoQueryFunc();

// Get the table function to list routing index entries.
TableFunction GetListEntitiesQueryFunc();

// Get the table function to query remote files opened so far.
TableFunction GetFileStatusQueryFunc();

// Get the table function to query current configuration.
TableFunction GetConfigQueryFunc();

} // namespace remote_pager
