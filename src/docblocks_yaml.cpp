#include "docblocks_yaml.hpp"

#include "duckdb/common/exception.hpp"

#include <ryml/ryml_std.hpp>

namespace duckdb {

static constexpr const char *YAML_ERROR_TEMPLATE_SEPARATOR = "------------------------------";
static constexpr idx_t CONTEXT_LINES_BEFORE = 3;
static constexpr idx_t CONTEXT_LINES_AFTER = 4;
static constexpr idx_t LINE_NUMBER_WIDTH = 3;

YamlDecodeError::YamlDecodeError(const string &message, optional_idx line_p)
    : std::runtime_error(message), line(line_p) {
}

// ryml calls this instead of abort() when it encounters a parse error.
// ryml positions are 1-based; 0 means the error has no position.
static void RymlErrorCallback(const char *msg, size_t msg_len, ryml::Location loc, void * /*userdata*/) {
	optional_idx line;
	if (loc.line > 0) {
		line = optional_idx(loc.line - 1);
	}
	throw YamlDecodeError(string(msg, msg_len), line);
}

ryml::ConstNodeRef DecodedYaml::Root() const {
	return tree.cref(document);
}

string DecodedYaml::ToJson() const {
	return ryml::emitrs_json<string>(Root());
}

static bool IsEmptyNode(const ryml::Tree &tree, ryml::id_type id) {
	if (tree.is_map(id) || tree.is_seq(id)) {
		return false;
	}
	return !tree.has_val(id) || tree.val_is_null(id);
}

unique_ptr<DecodedYaml> DecodeYaml(const string &text) {
	auto result = make_uniq<DecodedYaml>();
	result->buffer = text;

	ryml::Callbacks callbacks = ryml::get_callbacks();
	callbacks.m_error = RymlErrorCallback;
	result->tree = ryml::Tree(callbacks);
	ryml::EventHandlerTree evth(callbacks);
	ryml::Parser parser(&evth);
	ryml::parse_in_place(&parser, ryml::to_substr(result->buffer), &result->tree);

	auto &tree = result->tree;
	ryml::id_type id = tree.root_id();
	if (tree.is_stream(id)) {
		auto documents = tree.num_children(id);
		if (documents == 0) {
			return nullptr;
		}
		if (documents > 1) {
			throw YamlDecodeError("expected a single document in the stream but found " + std::to_string(documents),
			                      optional_idx());
		}
		id = tree.first_child(id);
	}

	if (IsEmptyNode(tree, id)) {
		return nullptr;
	}
	result->document = id;
	return result;
}

unique_ptr<DecodedYaml> DecodeYamlOrThrow(const string &text) {
	try {
		return DecodeYaml(text);
	} catch (const YamlDecodeError &error) {
		if (!error.line.IsValid()) {
			throw InvalidInputException(string(error.what()));
		}
		throw InvalidInputException(ContextualizeYamlError(text, error));
	}
}

static string LineNumberPrefix(idx_t number, const string &line) {
	auto label = std::to_string(number);
	if (label.size() < LINE_NUMBER_WIDTH) {
		label.append(LINE_NUMBER_WIDTH - label.size(), ' ');
	}
	return label + "| " + line;
}

// Unlike StringUtil::Split this keeps a trailing empty line.
static vector<string> SplitLines(const string &text) {
	vector<string> lines;
	idx_t start = 0;
	while (true) {
		auto end = text.find('\n', start);
		if (end == string::npos) {
			lines.push_back(text.substr(start));
			break;
		}
		lines.push_back(text.substr(start, end - start));
		start = end + 1;
	}
	return lines;
}

string PrefixWithLineNumbers(const string &text, idx_t start, idx_t end) {
	auto lines = SplitLines(text);
	string result;
	for (idx_t i = start; i < end && i < lines.size(); i++) {
		if (i > start) {
			result += "\n";
		}
		result += LineNumberPrefix(i + 1, lines[i]);
	}
	return result;
}

string ContextualizeYamlError(const string &document, const YamlDecodeError &error, idx_t line_offset) {
	if (!error.line.IsValid()) {
		return error.what();
	}
	idx_t line = error.line.GetIndex() + line_offset;
	idx_t min_line = line >= CONTEXT_LINES_BEFORE ? line - CONTEXT_LINES_BEFORE : 0;
	idx_t max_line = line + CONTEXT_LINES_AFTER;

	string message = "Syntax error near line " + std::to_string(line + 1) + "\n";
	message += string(YAML_ERROR_TEMPLATE_SEPARATOR) + "\n";
	message += PrefixWithLineNumbers(document, min_line, max_line) + "\n";
	message += "\nRaw Error:\n";
	message += string(YAML_ERROR_TEMPLATE_SEPARATOR) + "\n";
	message += error.what();
	return message;
}

} // namespace duckdb
