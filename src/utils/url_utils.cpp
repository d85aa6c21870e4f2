#include "url_utils.hpp"

#include "duckdb/common/string_util.hpp"

namespace remote_pager {

namespace {

// Remove `.` and `..` segments from an absolute [path]; `..` at the root stays at the root.
string RemoveDotSegments(const string &path) {
	const auto segments = StringUtil::Split(path, '/');
	vector<string> output_segments;
	for (const auto &cur_segment : segments) {
		// Empty segments come from the leading slash and from repeated slashes.
		if (cur_segment.empty() || cur_segment == ".") {
			continue;
		}
		if (cur_segment == "..") {
			if (!output_segments.empty()) {
				output_segments.pop_back();
			}
			continue;
		}
		output_segments.emplace_back(cur_segment);
	}

	string result = "/" + StringUtil::Join(output_segments, "/");
	// A trailing dot segment or slash still denotes a directory.
	const bool ends_with_directory =
	    StringUtil::EndsWith(path, "/") || StringUtil::EndsWith(path, "/.") || StringUtil::EndsWith(path, "/..");
	if (ends_with_directory && !output_segments.empty()) {
		result += "/";
	}
	return result;
}

} // namespace

string URLUtils::StripQueryAndFragment(const string &url) {
	// Query parameters start with '?', fragments start with '#'; strip from whichever comes first.
	const auto strip_pos = url.find_first_of("?#");
	if (strip_pos != string::npos) {
		return url.substr(0, strip_pos);
	}
	return url;
}

ParsedURL URLUtils::ParseURL(const string &url) {
	ParsedURL result;
	if (url.empty()) {
		return result;
	}

	size_t pos = 0;
	const size_t url_len = url.length();

	// 1. Parse scheme (e.g., "http://", "https://")
	const auto scheme_end = url.find("://", pos);
	if (scheme_end != string::npos) {
		result.scheme = url.substr(pos, scheme_end - pos);
		pos = scheme_end + 3;
	}

	// 2. Find the end of host (marked by '/', '?', or '#')
	const size_t host_end = url.find_first_of("/?#", pos);
	if (host_end == string::npos) {
		result.host = url.substr(pos);
		result.url_without_query = url;
		return result;
	}
	result.host = url.substr(pos, host_end - pos);
	pos = host_end;

	// 3. Parse path (until '?' or '#')
	const size_t path_end = url.find_first_of("?#", pos);
	if (path_end == string::npos) {
		result.path = url.substr(pos);
		result.url_without_query = url;
		return result;
	}
	result.path = url.substr(pos, path_end - pos);
	result.url_without_query = url.substr(0, path_end);
	pos = path_end;

	// 4. Parse query (if starts with '?')
	if (pos < url_len && url[pos] == '?') {
		++pos;
		const size_t query_end = url.find('#', pos);
		if (query_end == string::npos) {
			result.query = url.substr(pos);
			return result;
		}
		result.query = url.substr(pos, query_end - pos);
		pos = query_end;
	}

	// 5. Parse fragment (if starts with '#')
	if (pos < url_len && url[pos] == '#') {
		result.fragment = url.substr(pos + 1);
	}
	return result;
}

bool URLUtils::HasScheme(const string &url) {
	const auto scheme_end = url.find("://");
	if (scheme_end == string::npos || scheme_end == 0) {
		return false;
	}
	// Scheme only contains alphanumeric characters and "+-.", which rules out "://" inside of a query string.
	for (idx_t idx = 0; idx < scheme_end; ++idx) {
		const char cur_char = url[idx];
		if (!StringUtil::CharacterIsAlphaNumeric(cur_char) && cur_char != '+' && cur_char != '-' && cur_char != '.') {
			return false;
		}
	}
	return true;
}

string URLUtils::ResolveReference(const string &base_url, const string &reference) {
	if (HasScheme(reference)) {
		return reference;
	}

	const auto parsed_base = ParseURL(base_url);
	const string origin = parsed_base.scheme.empty()
	                          ? parsed_base.host
	                          : StringUtil::Format("%s://%s", parsed_base.scheme, parsed_base.host);

	// Query and fragment of the reference are kept as written, only the path is normalized.
	const auto suffix_pos = reference.find_first_of("?#");
	const string reference_path = suffix_pos == string::npos ? reference : reference.substr(0, suffix_pos);
	const string reference_suffix = suffix_pos == string::npos ? "" : reference.substr(suffix_pos);

	// Reference relative to the host root.
	if (StringUtil::StartsWith(reference_path, "/")) {
		return origin + RemoveDotSegments(reference_path) + reference_suffix;
	}

	// Reference relative to the directory of the base url.
	string directory = parsed_base.path;
	const auto last_slash = directory.rfind('/');
	directory = last_slash == string::npos ? "/" : directory.substr(0, last_slash + 1);
	return origin + RemoveDotSegments(directory + reference_path) + reference_suffix;
}

} // namespace remote_pager
