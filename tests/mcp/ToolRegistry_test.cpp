#include "mcp/ToolRegistry.hpp"
#include "core/Errors.hpp"
#include "tools/MockApiClient.hpp"
#include <gtest/gtest.h>

using namespace gitea_mcp;

namespace {

ToolInfo make_info(const std::string& name) {
    return {name, "Test tool " + name, InputSchema{}};
}

} // namespace

class ToolRegistryTest : public ::testing::Test {
protected:
    ToolRegistry registry;
    MockApiClient client;
};

TEST_F(ToolRegistryTest, RegisterAndList) {
    registry.register_tool(make_info("b_tool"), [](IApiClient&, const json&) { return json(); });
    registry.register_tool(make_info("a_tool"), [](IApiClient&, const json&) { return json(); });

    auto tools = registry.list();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "b_tool");
    EXPECT_EQ(tools[1].name, "a_tool");
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(ToolRegistryTest, RejectsDuplicateName) {
    registry.register_tool(make_info("dup"), [](IApiClient&, const json&) { return json(); });

    EXPECT_THROW(
        registry.register_tool(make_info("dup"), [](IApiClient&, const json&) { return json(); }),
        std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ToolRegistryTest, RejectsEmptyNameAndNullHandler) {
    EXPECT_THROW(
        registry.register_tool(make_info(""), [](IApiClient&, const json&) { return json(); }),
        std::invalid_argument);
    EXPECT_THROW(registry.register_tool(make_info("x"), ToolHandler()), std::invalid_argument);
}

TEST_F(ToolRegistryTest, CallPassesClientAndArguments) {
    registry.register_tool(make_info("get"), [](IApiClient& api, const json& args) {
        return api.get("/things/" + args["id"].get<std::string>());
    });
    client.set_response({{"id", 7}});

    ToolResult result = registry.call(client, "get", {{"id", "7"}});

    EXPECT_FALSE(result.is_error);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text, json({{"id", 7}}).dump(2));
    ASSERT_EQ(client.requests().size(), 1u);
    EXPECT_EQ(client.last_request().path, "/things/7");
}

TEST_F(ToolRegistryTest, NullResultRendersAsNull) {
    registry.register_tool(make_info("nothing"), [](IApiClient&, const json&) { return json(); });

    ToolResult result = registry.call(client, "nothing", json::object());
    EXPECT_EQ(result.content[0].text, "null");
}

TEST_F(ToolRegistryTest, HandlerExceptionBecomesErrorResult) {
    registry.register_tool(make_info("broken"), [](IApiClient&, const json&) -> json {
        throw ValidationError("index is required");
    });

    ToolResult result = registry.call(client, "broken", json::object());

    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text, "Error: index is required");
}

TEST_F(ToolRegistryTest, UnknownToolThrows) {
    try {
        registry.call(client, "missing", json::object());
        FAIL() << "Expected UnknownToolError";
    } catch (const UnknownToolError& e) {
        EXPECT_STREQ(e.what(), "unknown tool: missing");
    }
}
