#include <gtest/gtest.h>

#include "errors.hpp"
#include "rpc_client.hpp"
#include "test_helpers.hpp"
#include "weather/weather_agent.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

using mcp::json;

namespace {
class LoggingEnvironment final : public ::testing::Environment {
public:
	void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

// Swallows the request, answers with the given line, then idles until stdin closes.
std::string answer_once(const std::string& response) {
	return "read request; echo '" + response + "'; cat > /dev/null";
}
}

TEST(RpcClient, ListsWeatherToolsFromServer) {
	mcp::RpcClient client(tool_server_config());
	ASSERT_TRUE(client.start());
	ASSERT_TRUE(client.is_running());

	auto tools = client.list_tools();
	ASSERT_EQ(tools.size(), 4u);
	EXPECT_EQ(tools[0].name, "get_current_weather");
	EXPECT_EQ(tools[1].name, "get_forecast");
	EXPECT_EQ(tools[2].name, "get_alerts");
	EXPECT_EQ(tools[3].name, "get_air_quality");
	for (const auto& tool : tools) {
		EXPECT_FALSE(tool.description.empty());
		EXPECT_EQ(tool.input_schema["type"], "object");
	}

	client.stop();
	EXPECT_FALSE(client.is_running());
}

TEST(RpcClient, CallToolReturnsResult) {
	mcp::RpcClient client(tool_server_config());
	ASSERT_TRUE(client.start());

	json result = client.call_tool("get_current_weather", {{"location", "London"}, {"units", "metric"}});
	EXPECT_EQ(result["location"], "London, UK");
	EXPECT_DOUBLE_EQ(result["temperature"].get<double>(), 12.5);
	EXPECT_EQ(result["humidity"], 72);
}

TEST(RpcClient, UnknownToolIsReportedInsideResult) {
	mcp::RpcClient client(tool_server_config());
	ASSERT_TRUE(client.start());

	json result;
	ASSERT_NO_THROW(result = client.call_tool("get_tides", {{"location", "London"}}));
	EXPECT_EQ(result["error"], "Unknown tool: get_tides");
	EXPECT_TRUE(client.is_running());

	// The session is still usable afterwards.
	EXPECT_EQ(client.list_tools().size(), 4u);
}

TEST(RpcClient, SequentialCallsUseFreshIds) {
	mcp::RpcClient client(tool_server_config());
	ASSERT_TRUE(client.start());

	for (int i = 0; i < 20; ++i) {
		json result = client.call_tool("get_forecast", {{"location", "Tokyo"}, {"days", 2}});
		ASSERT_TRUE(result.is_array());
		EXPECT_EQ(result.size(), 2u);
	}
}

TEST(RpcClient, StartReturnsFalseForMissingBinary) {
	mcp::ClientConfig config;
	config.command = "/nonexistent/weather_tool_server";
	mcp::RpcClient client(config);

	EXPECT_FALSE(client.start());
	EXPECT_FALSE(client.is_running());
	EXPECT_THROW(client.call(mcp::kMethodListTools), mcp::TransportError);
}

TEST(RpcClient, StopIsSafeBeforeStartAndWhenRepeated) {
	mcp::RpcClient client(tool_server_config());
	client.stop();

	ASSERT_TRUE(client.start());
	EXPECT_TRUE(client.start());
	client.stop();
	client.stop();
	EXPECT_FALSE(client.is_running());
}

TEST(RpcClient, CallBeforeStartRaisesTransportError) {
	mcp::RpcClient client(tool_server_config());
	EXPECT_THROW(client.list_tools(), mcp::TransportError);
}

TEST(RpcClient, ServerExitingMidCallRaisesTransportError) {
	mcp::RpcClient client(script_config("read request; echo 'giving up' >&2; exit 1"));
	ASSERT_TRUE(client.start());

	EXPECT_THROW(client.list_tools(), mcp::TransportError);
	EXPECT_FALSE(client.is_running());
	EXPECT_THROW(client.list_tools(), mcp::TransportError);

	auto diagnostics = client.recent_diagnostics();
	EXPECT_NE(std::find(diagnostics.begin(), diagnostics.end(), "giving up"), diagnostics.end());
}

TEST(RpcClient, ServerKilledBeforeCallRaisesTransportError) {
	mcp::RpcClient client(script_config("exit 0"));
	ASSERT_TRUE(client.start());

	for (int i = 0; i < 200 && client.is_running(); ++i) {
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	ASSERT_FALSE(client.is_running());

	EXPECT_THROW(client.call(mcp::kMethodListTools), mcp::TransportError);
	EXPECT_FALSE(client.is_running());
	EXPECT_THROW(client.call(mcp::kMethodListTools), mcp::TransportError);
}

TEST(RpcClient, SilentServerRaisesTransportErrorAfterTimeout) {
	mcp::RpcClient client(script_config("cat > /dev/null", 200));
	ASSERT_TRUE(client.start());

	EXPECT_THROW(client.call(mcp::kMethodListTools), mcp::TransportError);
	EXPECT_FALSE(client.is_running());
}

TEST(RpcClient, MismatchedIdRaisesUnexpectedResponse) {
	mcp::RpcClient client(script_config(answer_once(R"({"jsonrpc":"2.0","result":{},"id":99})")));
	ASSERT_TRUE(client.start());

	try {
		client.call(mcp::kMethodListTools);
		FAIL() << "expected UnexpectedResponse";
	} catch (const mcp::UnexpectedResponse& exc) {
		EXPECT_EQ(exc.expected_id(), 1);
		ASSERT_TRUE(exc.received_id().has_value());
		EXPECT_EQ(*exc.received_id(), 99);
	}
	EXPECT_FALSE(client.is_running());
}

TEST(RpcClient, NonJsonOutputRaisesMalformedMessage) {
	mcp::RpcClient client(script_config(answer_once("Starting weather server...")));
	ASSERT_TRUE(client.start());

	EXPECT_THROW(client.call(mcp::kMethodListTools), mcp::MalformedMessage);
	EXPECT_FALSE(client.is_running());
}

TEST(RpcClient, ErrorObjectRaisesRemoteError) {
	mcp::RpcClient client(script_config(answer_once(R"({"jsonrpc":"2.0","error":{"code":-32603,"message":"boom"},"id":1})")));
	ASSERT_TRUE(client.start());

	try {
		client.call(mcp::kMethodListTools);
		FAIL() << "expected RemoteError";
	} catch (const mcp::RemoteError& exc) {
		EXPECT_EQ(exc.code(), -32603);
		EXPECT_STREQ(exc.what(), "boom");
	}
	EXPECT_TRUE(client.is_running());
}

TEST(RpcClient, NullIdParseErrorRaisesRemoteError) {
	mcp::RpcClient client(script_config(answer_once(R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"Parse error"},"id":null})")));
	ASSERT_TRUE(client.start());

	try {
		client.call(mcp::kMethodListTools);
		FAIL() << "expected RemoteError";
	} catch (const mcp::RemoteError& exc) {
		EXPECT_EQ(exc.code(), -32700);
	}
}

TEST(RpcClient, BlankLinesBeforeResponseAreSkipped) {
	mcp::RpcClient client(script_config("read request; echo; echo '   '; echo '{\"jsonrpc\":\"2.0\",\"result\":{\"tools\":[]},\"id\":1}'; cat > /dev/null"));
	ASSERT_TRUE(client.start());

	EXPECT_TRUE(client.list_tools().empty());
}

TEST(RpcClient, ToolsResultWithoutArrayIsMalformed) {
	mcp::RpcClient client(script_config(answer_once(R"({"jsonrpc":"2.0","result":{"tools":"none"},"id":1})")));
	ASSERT_TRUE(client.start());

	EXPECT_THROW(client.list_tools(), mcp::MalformedMessage);
}

TEST(WeatherAgent, StartsAndFetchesTypedWeather) {
	mcp::RpcClient client(tool_server_config());
	weather::WeatherAgent agent(client, weather::Units::Imperial);
	ASSERT_TRUE(agent.start());

	auto current = agent.current_weather("London");
	ASSERT_TRUE(current.has_value());
	EXPECT_EQ(current->location, "London, UK");
	EXPECT_NEAR(current->temperature, 54.5, 0.01);
	EXPECT_EQ(current->units, weather::Units::Imperial);

	auto days = agent.forecast("Miami", 3);
	ASSERT_TRUE(days.has_value());
	EXPECT_EQ(days->size(), 3u);

	auto quality = agent.air_quality("Sydney");
	ASSERT_TRUE(quality.has_value());
	EXPECT_GE(quality->aqi, 20);
	EXPECT_LE(quality->aqi, 150);

	EXPECT_TRUE(agent.alerts("Tokyo").has_value());

	agent.stop();
	EXPECT_FALSE(client.is_running());
}

TEST(WeatherAgent, DomainErrorsBecomeEmptyResults) {
	mcp::RpcClient client(tool_server_config());
	weather::WeatherAgent agent(client, weather::Units::Metric);
	ASSERT_TRUE(agent.start());

	EXPECT_FALSE(agent.forecast("London", 0).has_value());
	EXPECT_FALSE(agent.forecast("London", 17).has_value());
	EXPECT_TRUE(client.is_running());
}

TEST(WeatherAgent, AnalyzeCollectsAllLookups) {
	mcp::RpcClient client(tool_server_config());
	weather::WeatherAgent agent(client, weather::Units::Metric);
	ASSERT_TRUE(agent.start());

	json analysis = agent.analyze("Washington DC");
	EXPECT_EQ(analysis["location"], "Washington DC");
	EXPECT_EQ(analysis["units"], "metric");
	EXPECT_EQ(analysis["current"]["location"], "Washington DC, USA");
	EXPECT_EQ(analysis["forecast"].size(), 5u);
	EXPECT_TRUE(analysis["alerts"].is_array());
	EXPECT_TRUE(analysis["air_quality"].is_object());
}

TEST(WeatherAgent, StartFailsWhenToolsAreMissing) {
	mcp::RpcClient client(script_config(answer_once(R"({"jsonrpc":"2.0","result":{"tools":[{"name":"get_alerts"}]},"id":1})")));
	weather::WeatherAgent agent(client, weather::Units::Metric);

	EXPECT_FALSE(agent.start());
	EXPECT_FALSE(client.is_running());
}
