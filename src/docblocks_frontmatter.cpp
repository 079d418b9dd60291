#include "docblocks_frontmatter.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <algorithm>

namespace duckdb {

static constexpr const char *FRONTMATTER_ERROR_BANNER = "Error parsing YAML frontmatter!";

struct DelimiterLine {
	idx_t start; // offset of the first byte of the line
	idx_t next;  // offset just past the line terminator
};

FrontmatterErrorPolicy FrontmatterErrorPolicyFromString(const string &policy) {
	auto lowered = StringUtil::Lower(policy);
	if (lowered == "ignore") {
		return FrontmatterErrorPolicy::IGNORE;
	}
	if (lowered == "warn_or_error") {
		return FrontmatterErrorPolicy::WARN_OR_ERROR;
	}
	throw InvalidInputException("Unknown frontmatter error policy \"%s\", expected 'ignore' or 'warn_or_error'",
	                            policy);
}

static bool IsHorizontalSpace(char c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

static bool IsDelimiterLine(const string &s, idx_t begin, idx_t end) {
	while (begin < end && IsHorizontalSpace(s[begin])) {
		begin++;
	}
	while (end > begin && IsHorizontalSpace(s[end - 1])) {
		end--;
	}
	return end - begin == 3 && s.compare(begin, 3, "---") == 0;
}

// Collect up to `max_count` delimiter lines, in order.
static vector<DelimiterLine> FindDelimiters(const string &s, idx_t max_count) {
	vector<DelimiterLine> result;
	idx_t line_start = 0;
	while (line_start <= s.size() && result.size() < max_count) {
		auto newline = s.find('\n', line_start);
		idx_t line_end = newline == string::npos ? s.size() : newline;
		idx_t next = newline == string::npos ? s.size() : newline + 1;
		if (IsDelimiterLine(s, line_start, line_end)) {
			result.push_back(DelimiterLine {line_start, next});
		}
		if (newline == string::npos) {
			break;
		}
		line_start = next;
	}
	return result;
}

static bool HasNonWhitespace(const string &s, idx_t end) {
	for (idx_t i = 0; i < end; i++) {
		if (!StringUtil::CharacterIsSpace(s[i])) {
			return true;
		}
	}
	return false;
}

FrontmatterResult ParseFrontmatter(const string &content, FrontmatterErrorPolicy policy, WarningChannel &warnings) {
	FrontmatterResult result;
	result.body = content;

	auto delimiters = FindDelimiters(content, 2);
	if (delimiters.size() < 2 || HasNonWhitespace(content, delimiters[0].start)) {
		return result;
	}

	idx_t yaml_start = delimiters[0].next;
	string yaml_block = content.substr(yaml_start, delimiters[1].start - yaml_start);

	try {
		result.properties = DecodeYaml(yaml_block);
	} catch (const YamlDecodeError &error) {
		if (policy == FrontmatterErrorPolicy::WARN_OR_ERROR) {
			// report the line in terms of the whole document, not the header slice
			auto line_offset = static_cast<idx_t>(std::count(content.begin(), content.begin() + yaml_start, '\n'));
			warnings.WarnOrError(string(FRONTMATTER_ERROR_BANNER) +
			                     ContextualizeYamlError(content, error, line_offset));
		}
		return result;
	}

	result.body = content.substr(delimiters[1].next);
	return result;
}

bool MightHaveFrontmatter(const string &content) {
	return !FindDelimiters(content, 1).empty();
}

} // namespace duckdb
