#pragma once

#include "docblocks_template.hpp"

namespace duckdb {

struct MacroCandidate {
	string macro_name;     // as declared, including the docs prefix
	string name;           // bare name
	string block_contents; // first literal text of the body, or empty
};

// Find every documentation macro in `contents`, in document order.
// Throws ParserException if `contents` is not a valid template.
vector<MacroCandidate> ScanDocBlocks(const string &contents);

// Same, over an already parsed template.
vector<MacroCandidate> ScanDocBlocks(const TemplateNode &root);

} // namespace duckdb
