#include "docblocks_template.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <algorithm>

namespace duckdb {

const char *TemplateNodeTypeToString(TemplateNodeType type) {
	switch (type) {
	case TemplateNodeType::TEMPLATE:
		return "TEMPLATE";
	case TemplateNodeType::OUTPUT:
		return "OUTPUT";
	case TemplateNodeType::TEMPLATE_DATA:
		return "TEMPLATE_DATA";
	case TemplateNodeType::EXPRESSION:
		return "EXPRESSION";
	case TemplateNodeType::MACRO:
		return "MACRO";
	case TemplateNodeType::CALL_BLOCK:
		return "CALL_BLOCK";
	case TemplateNodeType::IF:
		return "IF";
	case TemplateNodeType::FOR:
		return "FOR";
	case TemplateNodeType::BLOCK:
		return "BLOCK";
	case TemplateNodeType::FILTER_BLOCK:
		return "FILTER_BLOCK";
	case TemplateNodeType::ASSIGN:
		return "ASSIGN";
	case TemplateNodeType::ASSIGN_BLOCK:
		return "ASSIGN_BLOCK";
	case TemplateNodeType::WITH:
		return "WITH";
	case TemplateNodeType::SCOPED:
		return "SCOPED";
	case TemplateNodeType::STATEMENT:
		return "STATEMENT";
	}
	return "UNKNOWN";
}

void TemplateNode::EnumerateChildren(const std::function<void(const TemplateNode &child)> &callback) const {
	for (auto &child : children) {
		callback(*child);
	}
	for (auto &child : else_children) {
		callback(*child);
	}
}

static void FindAllRecursive(const TemplateNode &node, TemplateNodeType target,
                             vector<reference<const TemplateNode>> &result) {
	node.EnumerateChildren([&](const TemplateNode &child) {
		if (child.type == target) {
			result.push_back(child);
		}
		FindAllRecursive(child, target, result);
	});
}

vector<reference<const TemplateNode>> TemplateNode::FindAll(TemplateNodeType target) const {
	vector<reference<const TemplateNode>> result;
	FindAllRecursive(*this, target, result);
	return result;
}

//===--------------------------------------------------------------------===//
// Lexer
//===--------------------------------------------------------------------===//

enum class TemplateTokenType : uint8_t { DATA, VARIABLE, BLOCK };

struct TemplateToken {
	TemplateTokenType type;
	string value;
	idx_t line;
};

static bool IsTemplateSpace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Jinja normalizes line endings and drops a single trailing newline before lexing
static string NormalizeNewlines(const string &source) {
	string result;
	result.reserve(source.size());
	for (idx_t i = 0; i < source.size(); i++) {
		if (source[i] == '\r') {
			result += '\n';
			if (i + 1 < source.size() && source[i + 1] == '\n') {
				i++;
			}
		} else {
			result += source[i];
		}
	}
	if (!result.empty() && result.back() == '\n') {
		result.pop_back();
	}
	return result;
}

class TemplateLexer {
public:
	explicit TemplateLexer(const string &source_p) : source(NormalizeNewlines(source_p)) {
	}

	vector<TemplateToken> Tokenize() {
		idx_t data_start = 0;
		idx_t pos = 0;
		while (true) {
			auto open = FindOpening(pos);
			if (open == string::npos) {
				EmitData(data_start, source.size(), false);
				break;
			}
			char kind = source[open + 1];
			idx_t inner = open + 2;
			bool strip_before = false;
			if (inner < source.size() && (source[inner] == '-' || source[inner] == '+')) {
				strip_before = source[inner] == '-';
				inner++;
			}
			EmitData(data_start, open, strip_before);

			idx_t after;
			if (kind == '#') {
				after = LexComment(open, inner);
			} else {
				after = LexTag(open, inner, kind == '{' ? TemplateTokenType::VARIABLE : TemplateTokenType::BLOCK);
			}
			data_start = after;
			pos = after;
		}
		return std::move(tokens);
	}

private:
	string source;
	vector<TemplateToken> tokens;
	idx_t line = 1;
	idx_t line_pos = 0;

	idx_t LineAt(idx_t offset) {
		if (offset < line_pos) {
			line_pos = 0;
			line = 1;
		}
		line += static_cast<idx_t>(std::count(source.begin() + line_pos, source.begin() + offset, '\n'));
		line_pos = offset;
		return line;
	}

	idx_t FindOpening(idx_t pos) const {
		while (true) {
			auto open = source.find('{', pos);
			if (open == string::npos || open + 1 >= source.size()) {
				return string::npos;
			}
			char next = source[open + 1];
			if (next == '{' || next == '%' || next == '#') {
				return open;
			}
			pos = open + 1;
		}
	}

	idx_t SkipWhitespace(idx_t pos) const {
		while (pos < source.size() && IsTemplateSpace(source[pos])) {
			pos++;
		}
		return pos;
	}

	void EmitData(idx_t begin, idx_t end, bool strip_trailing) {
		if (strip_trailing) {
			while (end > begin && IsTemplateSpace(source[end - 1])) {
				end--;
			}
		}
		if (end <= begin) {
			return;
		}
		tokens.push_back(TemplateToken {TemplateTokenType::DATA, source.substr(begin, end - begin), LineAt(begin)});
	}

	idx_t LexComment(idx_t open, idx_t inner) {
		auto close = source.find("#}", inner);
		if (close == string::npos) {
			throw ParserException("Missing end of comment tag opened on line " + std::to_string(LineAt(open)));
		}
		idx_t after = close + 2;
		if (close > inner && source[close - 1] == '-') {
			after = SkipWhitespace(after);
		}
		return after;
	}

	// Find the closing delimiter of a variable or block tag, skipping string literals
	// and bracketed literals such as {'a': {'b': 1}}.
	idx_t FindClosing(idx_t open, idx_t pos, char close_char) {
		idx_t depth = 0;
		while (pos < source.size()) {
			char c = source[pos];
			if (c == '\'' || c == '"') {
				pos++;
				while (pos < source.size() && source[pos] != c) {
					if (source[pos] == '\\') {
						pos++;
					}
					pos++;
				}
				if (pos >= source.size()) {
					throw ParserException("Unterminated string in tag opened on line " + std::to_string(LineAt(open)));
				}
				pos++;
				continue;
			}
			if (depth == 0 && c == close_char && pos + 1 < source.size() && source[pos + 1] == '}') {
				return pos;
			}
			if (c == '{' || c == '[' || c == '(') {
				depth++;
			} else if ((c == '}' || c == ']' || c == ')') && depth > 0) {
				depth--;
			}
			pos++;
		}
		throw ParserException("Unexpected end of template, tag opened on line " + std::to_string(LineAt(open)) +
		                      " was never closed");
	}

	idx_t LexTag(idx_t open, idx_t inner, TemplateTokenType type) {
		char close_char = type == TemplateTokenType::VARIABLE ? '}' : '%';
		auto close = FindClosing(open, inner, close_char);
		idx_t content_end = close;
		bool strip_after = false;
		if (close > inner && (source[close - 1] == '-' || source[close - 1] == '+')) {
			strip_after = source[close - 1] == '-';
			content_end--;
		}
		auto content = source.substr(inner, content_end - inner);
		StringUtil::Trim(content);
		idx_t after = close + 2;
		if (strip_after) {
			after = SkipWhitespace(after);
		}

		if (type == TemplateTokenType::BLOCK && content == "raw") {
			return LexRaw(open, after);
		}
		tokens.push_back(TemplateToken {type, content, LineAt(open)});
		return after;
	}

	// Everything up to {% endraw %} is literal data.
	idx_t LexRaw(idx_t open, idx_t body_start) {
		idx_t pos = body_start;
		while (true) {
			auto tag = source.find("{%", pos);
			if (tag == string::npos) {
				throw ParserException("Missing {% endraw %} for raw block opened on line " +
				                      std::to_string(LineAt(open)));
			}
			idx_t cursor = tag + 2;
			bool strip_before = false;
			if (cursor < source.size() && (source[cursor] == '-' || source[cursor] == '+')) {
				strip_before = source[cursor] == '-';
				cursor++;
			}
			cursor = SkipWhitespace(cursor);
			if (source.compare(cursor, 6, "endraw") != 0) {
				pos = tag + 2;
				continue;
			}
			cursor = SkipWhitespace(cursor + 6);
			bool strip_after = false;
			if (cursor < source.size() && (source[cursor] == '-' || source[cursor] == '+')) {
				strip_after = source[cursor] == '-';
				cursor++;
			}
			if (source.compare(cursor, 2, "%}") != 0) {
				pos = tag + 2;
				continue;
			}
			EmitData(body_start, tag, strip_before);
			idx_t after = cursor + 2;
			if (strip_after) {
				after = SkipWhitespace(after);
			}
			return after;
		}
	}
};

//===--------------------------------------------------------------------===//
// Tag reader
//===--------------------------------------------------------------------===//

// Cursor over the text of a single {% ... %} tag.
class TagReader {
public:
	TagReader(const string &text_p, idx_t line_p) : text(text_p), line(line_p) {
	}

	void SkipWhitespace() {
		while (pos < text.size() && IsTemplateSpace(text[pos])) {
			pos++;
		}
	}

	string ReadIdentifier() {
		SkipWhitespace();
		idx_t start = pos;
		if (pos < text.size() && (StringUtil::CharacterIsAlpha(text[pos]) || text[pos] == '_')) {
			pos++;
			while (pos < text.size() && (StringUtil::CharacterIsAlphaNumeric(text[pos]) || text[pos] == '_')) {
				pos++;
			}
		}
		return text.substr(start, pos - start);
	}

	bool Consume(char c) {
		SkipWhitespace();
		if (pos < text.size() && text[pos] == c) {
			pos++;
			return true;
		}
		return false;
	}

	string ReadStringLiteral() {
		SkipWhitespace();
		if (pos >= text.size() || (text[pos] != '\'' && text[pos] != '"')) {
			throw ParserException("Expected a string literal on line " + std::to_string(line));
		}
		char quote = text[pos++];
		string value;
		while (pos < text.size() && text[pos] != quote) {
			if (text[pos] == '\\' && pos + 1 < text.size()) {
				pos++;
			}
			value += text[pos++];
		}
		pos++;
		return value;
	}

	string Rest() {
		SkipWhitespace();
		auto rest = text.substr(std::min(pos, (idx_t)text.size()));
		pos = text.size();
		return rest;
	}

	bool AtEnd() {
		SkipWhitespace();
		return pos >= text.size();
	}

private:
	const string &text;
	idx_t line;
	idx_t pos = 0;
};

// `set x = 1` assigns inline, `set x` opens a block
static bool HasTopLevelAssign(const string &text) {
	char quote = 0;
	int depth = 0;
	for (idx_t i = 0; i < text.size(); i++) {
		char c = text[i];
		if (quote) {
			if (c == '\\') {
				i++;
			} else if (c == quote) {
				quote = 0;
			}
			continue;
		}
		switch (c) {
		case '\'':
		case '"':
			quote = c;
			break;
		case '(':
		case '[':
		case '{':
			depth++;
			break;
		case ')':
		case ']':
		case '}':
			depth--;
			break;
		case '=': {
			bool comparison = (i + 1 < text.size() && text[i + 1] == '=') ||
			                  (i > 0 && (text[i - 1] == '=' || text[i - 1] == '!' || text[i - 1] == '<' ||
			                             text[i - 1] == '>'));
			if (depth == 0 && !comparison) {
				return true;
			}
			break;
		}
		default:
			break;
		}
	}
	return false;
}

//===--------------------------------------------------------------------===//
// Parser
//===--------------------------------------------------------------------===//

struct EndTag {
	string tag;
	string rest;
	idx_t line;
};

class TemplateParser {
public:
	explicit TemplateParser(vector<TemplateToken> tokens_p) : tokens(std::move(tokens_p)) {
	}

	unique_ptr<TemplateNode> Parse() {
		auto root = make_uniq<TemplateNode>(TemplateNodeType::TEMPLATE, 1);
		ParseStatements(root->children, {}, "", 0);
		return root;
	}

private:
	vector<TemplateToken> tokens;
	idx_t position = 0;

	static bool IsEndTag(const string &tag) {
		return StringUtil::StartsWith(tag, "end") || tag == "elif" || tag == "else";
	}

	// Parse nodes into `body` until one of `end_tags` closes the run.
	EndTag ParseStatements(vector<unique_ptr<TemplateNode>> &body, const vector<string> &end_tags,
	                       const string &opened_tag, idx_t opened_line) {
		unique_ptr<TemplateNode> output;
		auto flush = [&]() {
			if (output) {
				body.push_back(std::move(output));
			}
		};

		while (position < tokens.size()) {
			auto &token = tokens[position];
			if (token.type == TemplateTokenType::DATA || token.type == TemplateTokenType::VARIABLE) {
				if (!output) {
					output = make_uniq<TemplateNode>(TemplateNodeType::OUTPUT, token.line);
				}
				if (token.type == TemplateTokenType::VARIABLE && token.value.empty()) {
					throw ParserException("Expected an expression on line " + std::to_string(token.line));
				}
				auto node_type = token.type == TemplateTokenType::DATA ? TemplateNodeType::TEMPLATE_DATA
				                                                       : TemplateNodeType::EXPRESSION;
				auto node = make_uniq<TemplateNode>(node_type, token.line);
				node->data = token.value;
				output->children.push_back(std::move(node));
				position++;
				continue;
			}

			flush();
			TagReader reader(token.value, token.line);
			auto tag = reader.ReadIdentifier();
			if (tag.empty()) {
				throw ParserException("Expected a tag name on line " + std::to_string(token.line));
			}
			position++;
			if (std::find(end_tags.begin(), end_tags.end(), tag) != end_tags.end()) {
				return EndTag {tag, reader.Rest(), token.line};
			}
			body.push_back(ParseStatement(tag, reader, token.line));
		}
		flush();

		if (!end_tags.empty()) {
			throw ParserException("Unexpected end of template, expected '" + end_tags.back() + "' to close '" +
			                      opened_tag + "' on line " + std::to_string(opened_line));
		}
		return EndTag();
	}

	string ReadName(TagReader &reader, const string &tag, idx_t line) {
		auto name = reader.ReadIdentifier();
		if (name.empty()) {
			throw ParserException("Expected a name after '" + tag + "' on line " + std::to_string(line));
		}
		return name;
	}

	string ReadSignature(TagReader &reader, const string &tag, idx_t line) {
		auto signature = reader.Rest();
		if (!StringUtil::StartsWith(signature, "(")) {
			throw ParserException("Expected '(' to start the argument list of '" + tag + "' on line " +
			                      std::to_string(line));
		}
		return signature;
	}

	unique_ptr<TemplateNode> ParseMacroBody(unique_ptr<TemplateNode> node, const string &tag) {
		ParseStatements(node->children, {"end" + tag}, tag, node->line);
		return node;
	}

	unique_ptr<TemplateNode> ParseIf(const string &test, idx_t line) {
		auto node = make_uniq<TemplateNode>(TemplateNodeType::IF, line);
		node->data = test;
		auto end = ParseStatements(node->children, {"elif", "else", "endif"}, "if", line);
		if (end.tag == "elif") {
			node->else_children.push_back(ParseIf(end.rest, end.line));
		} else if (end.tag == "else") {
			ParseStatements(node->else_children, {"endif"}, "if", line);
		}
		return node;
	}

	unique_ptr<TemplateNode> ParseStatement(const string &tag, TagReader &reader, idx_t line) {
		if (tag == "macro") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::MACRO, line);
			node->name = ReadName(reader, tag, line);
			node->data = ReadSignature(reader, tag, line);
			return ParseMacroBody(std::move(node), tag);
		}
		if (tag == "docs") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::MACRO, line);
			node->name = string(DOCS_MACRO_PREFIX) + ReadName(reader, tag, line);
			if (!reader.AtEnd()) {
				throw ParserException("Unexpected '" + reader.Rest() + "' after docs name on line " +
				                      std::to_string(line));
			}
			return ParseMacroBody(std::move(node), tag);
		}
		if (tag == "materialization") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::MACRO, line);
			auto name = ReadName(reader, tag, line);
			string adapter = "default";
			while (reader.Consume(',')) {
				auto argument = reader.ReadIdentifier();
				if (argument == "default") {
					continue;
				}
				if (argument == "adapter" && reader.Consume('=')) {
					adapter = reader.ReadStringLiteral();
					continue;
				}
				throw ParserException("Invalid materialization argument '" + argument + "' on line " +
				                      std::to_string(line));
			}
			node->name = "materialization_" + name + "_" + adapter;
			return ParseMacroBody(std::move(node), tag);
		}
		if (tag == "test") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::MACRO, line);
			node->name = "test_" + ReadName(reader, tag, line);
			node->data = ReadSignature(reader, tag, line);
			return ParseMacroBody(std::move(node), tag);
		}
		if (tag == "if") {
			return ParseIf(reader.Rest(), line);
		}
		if (tag == "for") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::FOR, line);
			node->data = reader.Rest();
			if (node->data.empty()) {
				throw ParserException("Expected a loop target on line " + std::to_string(line));
			}
			auto end = ParseStatements(node->children, {"else", "endfor"}, tag, line);
			if (end.tag == "else") {
				ParseStatements(node->else_children, {"endfor"}, tag, line);
			}
			return node;
		}
		if (tag == "call") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::CALL_BLOCK, line);
			node->data = reader.Rest();
			ParseStatements(node->children, {"endcall"}, tag, line);
			return node;
		}
		if (tag == "block") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::BLOCK, line);
			node->name = ReadName(reader, tag, line);
			node->data = reader.Rest();
			ParseStatements(node->children, {"endblock"}, tag, line);
			return node;
		}
		if (tag == "filter") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::FILTER_BLOCK, line);
			node->data = reader.Rest();
			ParseStatements(node->children, {"endfilter"}, tag, line);
			return node;
		}
		if (tag == "with") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::WITH, line);
			node->data = reader.Rest();
			ParseStatements(node->children, {"endwith"}, tag, line);
			return node;
		}
		if (tag == "autoescape") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::SCOPED, line);
			node->name = tag;
			node->data = reader.Rest();
			ParseStatements(node->children, {"endautoescape"}, tag, line);
			return node;
		}
		if (tag == "set") {
			auto target = reader.Rest();
			if (HasTopLevelAssign(target)) {
				auto node = make_uniq<TemplateNode>(TemplateNodeType::ASSIGN, line);
				node->data = target;
				return node;
			}
			auto node = make_uniq<TemplateNode>(TemplateNodeType::ASSIGN_BLOCK, line);
			node->name = target;
			ParseStatements(node->children, {"endset"}, tag, line);
			return node;
		}
		if (tag == "extends" || tag == "include" || tag == "import" || tag == "from" || tag == "do" ||
		    tag == "break" || tag == "continue") {
			auto node = make_uniq<TemplateNode>(TemplateNodeType::STATEMENT, line);
			node->name = tag;
			node->data = reader.Rest();
			return node;
		}
		if (IsEndTag(tag)) {
			throw ParserException("Unexpected tag '" + tag + "' on line " + std::to_string(line));
		}
		throw ParserException("Encountered unknown tag '" + tag + "' on line " + std::to_string(line));
	}
};

unique_ptr<TemplateNode> ParseTemplate(const string &source) {
	TemplateLexer lexer(source);
	TemplateParser parser(lexer.Tokenize());
	return parser.Parse();
}

} // namespace duckdb
