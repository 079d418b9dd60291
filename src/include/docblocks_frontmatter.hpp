#pragma once

#include "docblocks_warnings.hpp"
#include "docblocks_yaml.hpp"

namespace duckdb {

enum class FrontmatterErrorPolicy : uint8_t { IGNORE, WARN_OR_ERROR };

FrontmatterErrorPolicy FrontmatterErrorPolicyFromString(const string &policy);

struct FrontmatterResult {
	unique_ptr<DecodedYaml> properties; // null if absent, empty or malformed
	string body;
};

// Split a `---` delimited YAML header off the start of `content`.
// Only whitespace may precede the opening delimiter. When the header does not
// decode, `policy` decides whether `warnings` hears about it; either way the
// whole of `content` comes back as the body.
FrontmatterResult ParseFrontmatter(const string &content, FrontmatterErrorPolicy policy, WarningChannel &warnings);

// Cheap pre-check: true if any line is a frontmatter delimiter.
bool MightHaveFrontmatter(const string &content);

} // namespace duckdb
