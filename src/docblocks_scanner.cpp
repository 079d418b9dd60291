#include "docblocks_scanner.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// Docs macros are assumed not to call other macros, so only the first literal
// text node of the body is kept. Any other shape yields an empty string.
static string ExtractBlockContents(const TemplateNode &macro) {
	if (macro.children.empty()) {
		return string();
	}
	auto &first = *macro.children[0];
	if (first.type != TemplateNodeType::OUTPUT || first.children.empty()) {
		return string();
	}
	auto &literal = *first.children[0];
	if (literal.type != TemplateNodeType::TEMPLATE_DATA) {
		return string();
	}
	return literal.data;
}

vector<MacroCandidate> ScanDocBlocks(const TemplateNode &root) {
	vector<MacroCandidate> result;
	const string prefix(DOCS_MACRO_PREFIX);
	for (auto &entry : root.FindAll(TemplateNodeType::MACRO)) {
		auto &macro = entry.get();
		if (!StringUtil::StartsWith(macro.name, prefix)) {
			continue;
		}
		MacroCandidate candidate;
		candidate.macro_name = macro.name;
		candidate.name = macro.name.substr(prefix.size());
		candidate.block_contents = ExtractBlockContents(macro);
		result.push_back(std::move(candidate));
	}
	return result;
}

vector<MacroCandidate> ScanDocBlocks(const string &contents) {
	auto root = ParseTemplate(contents);
	return ScanDocBlocks(*root);
}

} // namespace duckdb
