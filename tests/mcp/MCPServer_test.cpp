#include "mcp/MCPServer.hpp"
#include "core/Errors.hpp"
#include "MockTransport.hpp"
#include "tools/MockApiClient.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace gitea_mcp;
using json = nlohmann::json;

class MCPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<ToolRegistry>();

        registry->register_tool(
            {"echo", "Returns its arguments", InputSchema{}},
            [this](IApiClient&, const json& args) -> json {
                echo_calls++;
                return args;
            });

        registry->register_tool(
            {"fail", "Always fails", InputSchema{}},
            [](IApiClient&, const json&) -> json {
                throw ValidationError("title is required");
            });

        registry->register_tool(
            {"fetch", "Reads through the API client", InputSchema{}},
            [](IApiClient& client, const json&) -> json {
                return client.get("/version");
            });

        registry_ = registry;
        client_ = std::make_shared<MockApiClient>();
        ResetServer("acme", "widgets");
    }

    void ResetServer(const std::string& owner, const std::string& repo) {
        mock_transport_raw = new MockTransport();
        auto transport = std::unique_ptr<ITransport>(mock_transport_raw);
        server = std::make_unique<MCPServer>(std::move(transport), registry_, client_,
                                             ArgumentResolver(owner, repo));
    }

    static json Request(const json& id, const std::string& method, const json& params = json::object()) {
        return {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params}
        };
    }

    static json CallRequest(const json& id, const std::string& name, const json& arguments) {
        return Request(id, "tools/call", {{"name", name}, {"arguments", arguments}});
    }

    json RunSingle(const json& request) {
        mock_transport_raw->push_request(request);
        server->run();
        EXPECT_EQ(mock_transport_raw->response_count(), 1u);
        return mock_transport_raw->pop_response();
    }

    int echo_calls = 0;
    std::shared_ptr<const ToolRegistry> registry_;
    std::shared_ptr<MockApiClient> client_;
    MockTransport* mock_transport_raw = nullptr;
    std::unique_ptr<MCPServer> server;
};

TEST_F(MCPServerTest, ConstructorRejectsNullDependencies) {
    EXPECT_THROW(MCPServer(nullptr, registry_, client_, ArgumentResolver("", "")),
                 std::invalid_argument);
    EXPECT_THROW(MCPServer(std::make_unique<MockTransport>(), nullptr, client_,
                           ArgumentResolver("", "")),
                 std::invalid_argument);
    EXPECT_THROW(MCPServer(std::make_unique<MockTransport>(), registry_, nullptr,
                           ArgumentResolver("", "")),
                 std::invalid_argument);
}

TEST_F(MCPServerTest, Initialize) {
    json response = RunSingle(Request(1, "initialize", {
        {"protocolVersion", "2025-03-26"},
        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
    }));

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "gitea-mcp");
    EXPECT_TRUE(response["result"]["serverInfo"]["version"].is_string());
    EXPECT_TRUE(response["result"]["capabilities"]["tools"].is_object());
}

TEST_F(MCPServerTest, ToolsListInRegistrationOrder) {
    json response = RunSingle(Request(1, "tools/list"));

    ASSERT_TRUE(response["result"]["tools"].is_array());
    ASSERT_EQ(response["result"]["tools"].size(), 3u);
    EXPECT_EQ(response["result"]["tools"][0]["name"], "echo");
    EXPECT_EQ(response["result"]["tools"][1]["name"], "fail");
    EXPECT_EQ(response["result"]["tools"][2]["name"], "fetch");
    EXPECT_EQ(response["result"]["tools"][0]["inputSchema"]["type"], "object");
}

TEST_F(MCPServerTest, CallToolReturnsPrettyPrintedText) {
    json response = RunSingle(CallRequest(2, "echo", {{"owner", "o"}, {"repo", "r"}}));

    EXPECT_EQ(response["id"], 2);
    ASSERT_TRUE(response.contains("result"));
    const json& result = response["result"];
    EXPECT_FALSE(result.contains("isError"));
    ASSERT_EQ(result["content"].size(), 1u);
    EXPECT_EQ(result["content"][0]["type"], "text");

    json expected = {{"owner", "o"}, {"repo", "r"}};
    EXPECT_EQ(result["content"][0]["text"], expected.dump(2));
    EXPECT_EQ(echo_calls, 1);
}

TEST_F(MCPServerTest, CallToolInjectsDefaults) {
    json response = RunSingle(CallRequest(1, "echo", json::object()));

    json text = json::parse(response["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(text["owner"], "acme");
    EXPECT_EQ(text["repo"], "widgets");
}

TEST_F(MCPServerTest, CallToolWithoutArgumentsUsesEmptyObject) {
    ResetServer("", "");
    json response = RunSingle(Request(1, "tools/call", {{"name", "echo"}}));

    EXPECT_EQ(response["result"]["content"][0]["text"], "{}");
}

TEST_F(MCPServerTest, ToolFailureIsSuccessfulResponseWithIsError) {
    json response = RunSingle(CallRequest(3, "fail", json::object()));

    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_EQ(response["result"]["content"][0]["text"], "Error: title is required");
}

TEST_F(MCPServerTest, BackendErrorSurfacesAsToolFailure) {
    client_->set_responder([](const RecordedRequest&) -> json {
        throw ApiError(500, "boom");
    });

    json response = RunSingle(CallRequest(1, "fetch", json::object()));

    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_EQ(response["result"]["content"][0]["text"], "Error: API error 500: boom");
}

TEST_F(MCPServerTest, CallNonexistentTool) {
    json response = RunSingle(CallRequest(1, "nonexistent_tool", json::object()));

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], -32603);  // Internal error
    EXPECT_EQ(response["error"]["message"], "unknown tool: nonexistent_tool");
}

TEST_F(MCPServerTest, CallWithInvalidParams) {
    json response = RunSingle(Request(1, "tools/call", {{"arguments", json::object()}}));
    EXPECT_EQ(response["error"]["code"], -32602);
    EXPECT_EQ(response["error"]["message"], "Invalid tool call params");

    mock_transport_raw->push_request(Request(2, "tools/call", json::array()));
    server->run();
    EXPECT_EQ(mock_transport_raw->pop_response()["error"]["code"], -32602);
}

TEST_F(MCPServerTest, InvalidMethod) {
    json response = RunSingle(Request(1, "invalid/method"));

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], -32601);  // Method not found
    EXPECT_EQ(response["error"]["message"], "Method not found: invalid/method");
}

TEST_F(MCPServerTest, ParseErrorHasNoId) {
    mock_transport_raw->push_line("{not json");
    server->run();

    json response = mock_transport_raw->pop_response();
    EXPECT_EQ(response["error"]["code"], -32700);
    EXPECT_FALSE(response.contains("id"));
}

TEST_F(MCPServerTest, NonObjectMessageIsParseError) {
    mock_transport_raw->push_line("[1, 2, 3]");
    server->run();

    json response = mock_transport_raw->pop_response();
    EXPECT_EQ(response["error"]["code"], -32700);
    EXPECT_FALSE(response.contains("id"));
}

TEST_F(MCPServerTest, WrongJsonRpcVersion) {
    json request = Request(7, "tools/list");
    request["jsonrpc"] = "1.0";

    json response = RunSingle(request);
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["error"]["code"], -32600);
}

TEST_F(MCPServerTest, MissingMethod) {
    json response = RunSingle({{"jsonrpc", "2.0"}, {"id", 4}});

    EXPECT_EQ(response["id"], 4);
    EXPECT_EQ(response["error"]["code"], -32600);
}

TEST_F(MCPServerTest, InvalidIdType) {
    json request = Request(json::object(), "tools/list");

    json response = RunSingle(request);
    EXPECT_EQ(response["error"]["code"], -32600);
    EXPECT_FALSE(response.contains("id"));
}

TEST_F(MCPServerTest, StringIdIsEchoed) {
    json response = RunSingle(Request("abc-1", "tools/list"));
    EXPECT_EQ(response["id"], "abc-1");
}

TEST_F(MCPServerTest, NotificationsGetNoResponse) {
    mock_transport_raw->push_request({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    mock_transport_raw->push_request({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "tools/list"}});
    mock_transport_raw->push_request(
        {{"jsonrpc", "2.0"}, {"method", "tools/call"}, {"params", {{"name", "echo"}}}});

    server->run();

    EXPECT_FALSE(mock_transport_raw->has_responses());
    EXPECT_EQ(echo_calls, 0);
}

TEST_F(MCPServerTest, MultipleRequestsAnsweredInOrder) {
    for (int i = 1; i <= 3; i++) {
        mock_transport_raw->push_request(CallRequest(i, "echo", json::object()));
    }
    mock_transport_raw->push_line("garbage");
    mock_transport_raw->push_request(Request(4, "tools/list"));

    server->run();

    EXPECT_EQ(echo_calls, 3);
    ASSERT_EQ(mock_transport_raw->response_count(), 5u);
    for (int i = 1; i <= 3; i++) {
        EXPECT_EQ(mock_transport_raw->pop_response()["id"], i);
    }
    EXPECT_EQ(mock_transport_raw->pop_response()["error"]["code"], -32700);
    EXPECT_EQ(mock_transport_raw->pop_response()["id"], 4);
}

TEST_F(MCPServerTest, TransportFailureStopsServer) {
    mock_transport_raw->push_request(Request(1, "tools/list"));
    mock_transport_raw->fail_next_read();

    EXPECT_THROW(server->run(), TransportError);
    EXPECT_FALSE(mock_transport_raw->has_responses());
}

TEST_F(MCPServerTest, StopDuringRequestEndsLoop) {
    client_->set_responder([this](const RecordedRequest&) -> json {
        server->stop();
        return {{"version", "1.22.0"}};
    });
    mock_transport_raw->push_request(CallRequest(1, "fetch", json::object()));
    mock_transport_raw->push_request(Request(2, "tools/list"));

    server->run();

    ASSERT_EQ(mock_transport_raw->response_count(), 1u);
    EXPECT_EQ(mock_transport_raw->pop_response()["id"], 1);
}

TEST_F(MCPServerTest, StopDoesNotLog) {
    std::ostringstream log_output;
    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
    auto logger = std::make_shared<spdlog::logger>("stop-test", sink);
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    server->stop();

    spdlog::set_default_logger(previous);
    EXPECT_TRUE(log_output.str().empty());
}
