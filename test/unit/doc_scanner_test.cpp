#include "docblocks_scanner.hpp"
#include "duckdb/common/exception.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace duckdb;

TEST_CASE("Docs blocks are found with their contents", "[scanner]") {
	auto candidates = ScanDocBlocks("{% docs orders %}hello{% enddocs %}");
	REQUIRE(candidates.size() == 1);
	REQUIRE(candidates[0].macro_name == "dbt_docs__orders");
	REQUIRE(candidates[0].name == "orders");
	REQUIRE(candidates[0].block_contents == "hello");
}

TEST_CASE("Macros declared with the docs prefix count as docs blocks", "[scanner]") {
	auto candidates = ScanDocBlocks("{% macro dbt_docs__orders() %}hello{% endmacro %}");
	REQUIRE(candidates.size() == 1);
	REQUIRE(candidates[0].name == "orders");
	REQUIRE(candidates[0].block_contents == "hello");
}

TEST_CASE("Other macros and plain text are ignored", "[scanner]") {
	REQUIRE(ScanDocBlocks("select * from {{ ref('orders') }}").empty());
	REQUIRE(ScanDocBlocks("{% macro cents_to_dollars(col) %}{{ col }} / 100{% endmacro %}").empty());
	REQUIRE(ScanDocBlocks("{% macro my_dbt_docs__x() %}{% endmacro %}").empty());
	REQUIRE(ScanDocBlocks("").empty());
}

TEST_CASE("Docs blocks come back in document order", "[scanner]") {
	auto candidates = ScanDocBlocks("{% docs zeta %}z{% enddocs %}\n"
	                                "{% macro helper() %}{% endmacro %}\n"
	                                "{% docs alpha %}a{% enddocs %}\n");
	REQUIRE(candidates.size() == 2);
	REQUIRE(candidates[0].name == "zeta");
	REQUIRE(candidates[1].name == "alpha");
}

TEST_CASE("Only the leading literal of a docs body is kept", "[scanner]") {
	SECTION("empty body") {
		auto candidates = ScanDocBlocks("{% docs empty %}{% enddocs %}");
		REQUIRE(candidates.size() == 1);
		REQUIRE(candidates[0].block_contents.empty());
	}
	SECTION("body starting with an expression") {
		auto candidates = ScanDocBlocks("{% docs dynamic %}{{ var('x') }} orders{% enddocs %}");
		REQUIRE(candidates.size() == 1);
		REQUIRE(candidates[0].block_contents.empty());
	}
	SECTION("body starting with a statement") {
		auto candidates = ScanDocBlocks("{% docs cond %}{% if x %}yes{% endif %}{% enddocs %}");
		REQUIRE(candidates.size() == 1);
		REQUIRE(candidates[0].block_contents.empty());
	}
	SECTION("text after an expression is dropped") {
		auto candidates = ScanDocBlocks("{% docs mixed %}Total of {{ col }} in cents{% enddocs %}");
		REQUIRE(candidates.size() == 1);
		REQUIRE(candidates[0].block_contents == "Total of ");
	}
}

TEST_CASE("Multi-line docs contents are kept verbatim", "[scanner]") {
	auto candidates = ScanDocBlocks("{% docs orders %}\n"
	                                "# Orders\n"
	                                "\n"
	                                "One row per order.\n"
	                                "{% enddocs %}\n");
	REQUIRE(candidates.size() == 1);
	REQUIRE(candidates[0].block_contents == "\n# Orders\n\nOne row per order.\n");
}

TEST_CASE("Docs blocks nested in other constructs are found", "[scanner]") {
	auto candidates = ScanDocBlocks("{% if true %}{% docs nested %}inside{% enddocs %}{% endif %}");
	REQUIRE(candidates.size() == 1);
	REQUIRE(candidates[0].name == "nested");
	REQUIRE(candidates[0].block_contents == "inside");
}

TEST_CASE("Scanning an already parsed template gives the same result", "[scanner]") {
	auto root = ParseTemplate("{% docs a %}one{% enddocs %}{% docs b %}two{% enddocs %}");
	auto candidates = ScanDocBlocks(*root);
	REQUIRE(candidates.size() == 2);
	REQUIRE(candidates[1].block_contents == "two");
}

TEST_CASE("Invalid templates fail the scan", "[scanner]") {
	REQUIRE_THROWS_AS(ScanDocBlocks("{% docs broken %}never closed"), ParserException);
}
