#pragma once

#include "duckdb.hpp"
#include "duckdb/common/optional_idx.hpp"
#include <ryml/ryml.hpp>

#include <stdexcept>

namespace duckdb {

// Raised by the rapidyaml error callback and for multi-document streams.
class YamlDecodeError : public std::runtime_error {
public:
	YamlDecodeError(const string &message, optional_idx line);

	//! 0-based line of the offending token, invalid when the parser gave no position
	optional_idx line;
};

struct DecodedYaml {
	string buffer; // owns the text that ryml::Tree points into
	ryml::Tree tree;
	ryml::id_type document = ryml::NONE;

	ryml::ConstNodeRef Root() const;
	string ToJson() const;
};

// Decode `text`. The top level value may be a mapping, a sequence or a scalar.
// Returns nullptr for an empty document. Throws YamlDecodeError on malformed input.
unique_ptr<DecodedYaml> DecodeYaml(const string &text);

// Same as DecodeYaml, but decode failures are rethrown as InvalidInputException
// carrying a line-numbered excerpt of `text`.
unique_ptr<DecodedYaml> DecodeYamlOrThrow(const string &text);

// Render the "Syntax error near line N" message for `error` against `document`.
// `line_offset` is added to the error line when the YAML was cut out of a larger document.
string ContextualizeYamlError(const string &document, const YamlDecodeError &error, idx_t line_offset = 0);

// Lines [start, end) of `text`, each prefixed with its 1-based number.
string PrefixWithLineNumbers(const string &text, idx_t start, idx_t end);

} // namespace duckdb
