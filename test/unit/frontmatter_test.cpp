#include "docblocks_frontmatter.hpp"
#include "duckdb/common/exception.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace duckdb;
using docblocks_test::RecordingWarningChannel;

namespace {

const char *MALFORMED_DOCUMENT = "---\n"
                                 "title: Orders\n"
                                 "tags: [finance, core}\n"
                                 "---\n"
                                 "# Orders\n";

std::string ValueOf(const DecodedYaml &yaml, const char *key) {
	auto val = yaml.Root()[ryml::to_csubstr(key)].val();
	return std::string(val.str, val.len);
}

void RequireContains(const std::string &text, const std::string &needle) {
	INFO("text: " << text);
	REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("Frontmatter is split from the body", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("---\na: 1\n---\nBODY", FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE(fm.properties);
	REQUIRE(ValueOf(*fm.properties, "a") == "1");
	REQUIRE(fm.body == "BODY");
	REQUIRE(warnings.messages.empty());
}

TEST_CASE("Documents without delimiters come back unchanged", "[frontmatter]") {
	RecordingWarningChannel warnings;
	const std::vector<std::string> documents = {"", "plain text", "a: 1\nb: 2\n", "-- not a delimiter --\n",
	                                            "----\na: 1\n----\n", "line\r\nother\r\n"};
	for (auto &document : documents) {
		auto fm = ParseFrontmatter(document, FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
		REQUIRE_FALSE(fm.properties);
		REQUIRE(fm.body == document);
		REQUIRE_FALSE(MightHaveFrontmatter(document));
	}
	REQUIRE(warnings.messages.empty());
}

TEST_CASE("Text before the first delimiter disables frontmatter", "[frontmatter]") {
	RecordingWarningChannel warnings;
	const std::string document = "Intro\n---\na: 1\n---\nBODY";
	auto fm = ParseFrontmatter(document, FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == document);
	REQUIRE(MightHaveFrontmatter(document));
}

TEST_CASE("Leading whitespace before the first delimiter is allowed", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("\n  \n\t---  \ntitle: Orders\n  ---\nBODY\n", FrontmatterErrorPolicy::IGNORE,
	                           warnings);
	REQUIRE(fm.properties);
	REQUIRE(ValueOf(*fm.properties, "title") == "Orders");
	REQUIRE(fm.body == "BODY\n");
}

TEST_CASE("A single delimiter is not frontmatter", "[frontmatter]") {
	RecordingWarningChannel warnings;
	const std::string document = "---\na: 1\n";
	auto fm = ParseFrontmatter(document, FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == document);
	REQUIRE(MightHaveFrontmatter(document));
}

TEST_CASE("Only the first two delimiters split the document", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("---\na: 1\n---\nintro\n---\nmore\n", FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE(fm.properties);
	REQUIRE(fm.body == "intro\n---\nmore\n");
}

TEST_CASE("An empty header has no properties but still strips the header", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("---\n---\nBODY", FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == "BODY");
	REQUIRE(warnings.messages.empty());
}

TEST_CASE("Delimiter at the very end of the document gives an empty body", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("---\na: 1\n---", FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE(fm.properties);
	REQUIRE(fm.body.empty());
}

TEST_CASE("Malformed frontmatter is ignored silently under the ignore policy", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter(MALFORMED_DOCUMENT, FrontmatterErrorPolicy::IGNORE, warnings);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == MALFORMED_DOCUMENT);
	REQUIRE(warnings.messages.empty());
}

TEST_CASE("Malformed frontmatter is reported once under warn_or_error", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter(MALFORMED_DOCUMENT, FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == MALFORMED_DOCUMENT);
	REQUIRE(warnings.messages.size() == 1);

	auto &message = warnings.messages[0];
	REQUIRE(message.rfind("Error parsing YAML frontmatter!", 0) == 0);
	// the excerpt is taken from the whole document, so numbering includes the opening delimiter
	RequireContains(message, "Syntax error near line 3\n");
	RequireContains(message, "1  | ---\n");
	RequireContains(message, "3  | tags: [finance, core}");
	RequireContains(message, "Raw Error:");
}

TEST_CASE("Sequence frontmatter is decoded and stripped from the body", "[frontmatter]") {
	RecordingWarningChannel warnings;
	auto fm = ParseFrontmatter("---\n- a\n- b\n---\nBODY", FrontmatterErrorPolicy::WARN_OR_ERROR, warnings);
	REQUIRE(fm.properties);
	REQUIRE(fm.properties->Root().is_seq());
	REQUIRE(fm.properties->Root().num_children() == 2);
	REQUIRE(fm.body == "BODY");
	REQUIRE(warnings.messages.empty());

	LoggingWarningChannel strict(true);
	auto scalar = ParseFrontmatter("---\njust a title\n---\nBODY", FrontmatterErrorPolicy::WARN_OR_ERROR, strict);
	REQUIRE(scalar.properties);
	REQUIRE(scalar.body == "BODY");
}

TEST_CASE("Strict warning channel escalates malformed frontmatter", "[frontmatter]") {
	LoggingWarningChannel strict(true);
	REQUIRE_THROWS_AS(ParseFrontmatter(MALFORMED_DOCUMENT, FrontmatterErrorPolicy::WARN_OR_ERROR, strict),
	                  InvalidInputException);

	LoggingWarningChannel lenient(false);
	auto fm = ParseFrontmatter(MALFORMED_DOCUMENT, FrontmatterErrorPolicy::WARN_OR_ERROR, lenient);
	REQUIRE_FALSE(fm.properties);
	REQUIRE(fm.body == MALFORMED_DOCUMENT);
}

TEST_CASE("MightHaveFrontmatter never misses an extractable header", "[frontmatter]") {
	RecordingWarningChannel warnings;
	const std::vector<std::string> documents = {"---\na: 1\n---\n", "  ---\r\nb: 2\r\n---\r\nbody",
	                                            "\n\n---\nc: [1, 2]\n---", "---\nd: x\n---\n---\n"};
	for (auto &document : documents) {
		auto fm = ParseFrontmatter(document, FrontmatterErrorPolicy::IGNORE, warnings);
		REQUIRE(fm.properties);
		REQUIRE(MightHaveFrontmatter(document));
	}
	REQUIRE(MightHaveFrontmatter("text\n---\n"));
}

TEST_CASE("Error policies parse from strings", "[frontmatter]") {
	REQUIRE(FrontmatterErrorPolicyFromString("ignore") == FrontmatterErrorPolicy::IGNORE);
	REQUIRE(FrontmatterErrorPolicyFromString("WARN_OR_ERROR") == FrontmatterErrorPolicy::WARN_OR_ERROR);
	REQUIRE_THROWS_AS(FrontmatterErrorPolicyFromString("warn"), InvalidInputException);
}
