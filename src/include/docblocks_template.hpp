#pragma once

#include "duckdb.hpp"

#include <functional>

namespace duckdb {

// `{% docs name %}` blocks become macros named DOCS_MACRO_PREFIX + name
static constexpr const char *DOCS_MACRO_PREFIX = "dbt_docs__";

enum class TemplateNodeType : uint8_t {
	TEMPLATE,
	OUTPUT,
	TEMPLATE_DATA,
	EXPRESSION,
	MACRO,
	CALL_BLOCK,
	IF,
	FOR,
	BLOCK,
	FILTER_BLOCK,
	ASSIGN,
	ASSIGN_BLOCK,
	WITH,
	SCOPED,
	STATEMENT
};

const char *TemplateNodeTypeToString(TemplateNodeType type);

// One node of a statically parsed Jinja template. Which fields are used depends on `type`:
//   OUTPUT        - children are TEMPLATE_DATA and EXPRESSION nodes
//   TEMPLATE_DATA - data is the literal text
//   EXPRESSION    - data is the raw expression source
//   MACRO         - name, data holds the raw argument list, children is the body
//   IF / FOR      - data is the raw test, children the body, else_children the else branch
//   STATEMENT     - name is the tag, data the rest of the tag
struct TemplateNode {
	explicit TemplateNode(TemplateNodeType type, idx_t line = 0) : type(type), line(line) {
	}

	TemplateNodeType type;
	idx_t line;
	string name;
	string data;
	vector<unique_ptr<TemplateNode>> children;
	vector<unique_ptr<TemplateNode>> else_children;

	// Direct children in source order (body before else branch)
	void EnumerateChildren(const std::function<void(const TemplateNode &child)> &callback) const;
	// All descendants of the given type, depth first, in source order
	vector<reference<const TemplateNode>> FindAll(TemplateNodeType target) const;
};

// Parse `source` into a TEMPLATE node. Nothing is evaluated; expressions are kept as text.
// Throws ParserException on malformed templates.
unique_ptr<TemplateNode> ParseTemplate(const string &source);

} // namespace duckdb
