#pragma once

#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"

namespace remote_pager {

// A wrapper around [DUCKDB_LOG_DEBUG], which takes optional pointer for duckdb instance.
// Components are usable without a database instance (for example in unit tests), in which case nothing is logged.
#define REMOTE_PAGER_LOG_DEBUG(INSTANCE_PTR, ...)                                                                      \
	{                                                                                                                  \
		if (INSTANCE_PTR) {                                                                                            \
			DUCKDB_LOG_DEBUG(*INSTANCE_PTR, __VA_ARGS__);                                                              \
		}                                                                                                              \
	}

// A wrapper around [DUCKDB_LOG_WARN], which takes optional pointer for duckdb instance.
#define REMOTE_PAGER_LOG_WARN(INSTANCE_PTR, ...)                                                                       \
	{                                                                                                                  \
		if (INSTANCE_PTR) {                                                                                            \
			DUCKDB_LOG_WARN(*INSTANCE_PTR, __VA_ARGS__);                                                               \
		}                                                                                                              \
	}

} // namespace remote_pager
