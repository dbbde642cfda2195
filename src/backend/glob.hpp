#pragma once

#include <string>
#include <vector>

namespace skillkit::backend {

// Expand brace patterns like {a,b,c}, nested braces included:
// {a,b{c,d}} -> a, bc, bd
std::vector<std::string> expand_braces(const std::string &pattern);

// Match one path segment. Supports * ? [abc] [^abc] [!abc] [a-z]
bool match_segment(const std::string &pattern, const std::string &str);

// Match a relative path segment by segment; "**" spans any number of segments
bool match_glob(const std::string &pattern, const std::string &rel_path);

// Full glob semantics used by the file tools: braces are expanded, a
// pattern without "/" matches the file name only, otherwise the whole
// relative path
bool glob_matches(const std::string &pattern, const std::string &rel_path);

}  // namespace skillkit::backend
