#include <catch2/catch_test_macros.hpp>

#include <toolserve/mcp/schema_builder.hpp>

using namespace toolserve;

TEST_CASE("SchemaBuilder: empty object schema", "[mcp][schema]") {
    auto schema = SchemaBuilder::Object().ToJson();
    CHECK(schema["type"] == "object");
    CHECK(schema["properties"].is_object());
    CHECK(schema["properties"].empty());
    CHECK_FALSE(schema.contains("required"));
}

TEST_CASE("SchemaBuilder: string properties and required list", "[mcp][schema]") {
    auto schema = SchemaBuilder::Object()
        .StringProperty("checkId", "Check ID", true)
        .StringProperty("filter", "Optional filter")
        .StringProperty("scope", "Search scope", true)
        .ToJson();

    const auto& props = schema["properties"];
    CHECK(props["checkId"]["type"] == "string");
    CHECK(props["checkId"]["description"] == "Check ID");
    CHECK(props["filter"]["type"] == "string");

    REQUIRE(schema["required"].size() == 2);
    CHECK(schema["required"][0] == "checkId");
    CHECK(schema["required"][1] == "scope");
}

TEST_CASE("SchemaBuilder: Build produces parseable JSON text", "[mcp][schema]") {
    auto text = SchemaBuilder::Object().StringProperty("q", "Query", true).Build();
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    REQUIRE_FALSE(parsed.is_discarded());
    CHECK(parsed["properties"]["q"]["type"] == "string");
}
