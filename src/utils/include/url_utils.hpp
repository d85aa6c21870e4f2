#pragma once

#include "remote_pager_common.hpp"

namespace remote_pager {

//! Parsed URL components
struct ParsedURL {
	string scheme;            // e.g., "http", "https"
	string host;              // e.g., "cdn.example.com:8080"
	string path;              // e.g., "/editions/chunk_2.db"
	string query;             // e.g., "v=3"
	string fragment;          // e.g., "section1"
	string url_without_query; // Full URL without query parameters and fragment
};

//! URL parsing and manipulation utilities
class URLUtils {
public:
	//! Strip query parameters and fragment from a URL
	//! Example: "https://example.com/file.db?version=1#section" -> "https://example.com/file.db"
	static string StripQueryAndFragment(const string &url);

	//! Parse URL into components
	//! Example: "https://example.com:8080/path/file?param=value#fragment"
	static ParsedURL ParseURL(const string &url);

	//! Whether the given string carries a scheme, like "https://".
	static bool HasScheme(const string &url);

	//! Resolve [reference] against the directory containing [base_url].
	//! Absolute URLs are returned unchanged; references starting with '/' replace the path of [base_url].
	//! `.` and `..` segments are removed from the resolved path, `..` never climbs above the host root.
	//! Example: ("https://example.com/data/index.csv", "editions/chunk_2.db")
	//!   -> "https://example.com/data/editions/chunk_2.db"
	static string ResolveReference(const string &base_url, const string &reference);
};

} // namespace remote_pager
