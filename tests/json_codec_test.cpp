#include <gtest/gtest.h>

#include "errors.hpp"
#include "json_codec.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <limits>

using mcp::json;

namespace {
class LoggingEnvironment final : public ::testing::Environment {
public:
	void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());
}

TEST(JsonCodec, EncodeProducesSingleTerminatedLine) {
	json message = {{"text", "line one\nline two"}, {"nested", {{"a", 1}}}};
	std::string line = mcp::codec::encode(message);

	ASSERT_FALSE(line.empty());
	EXPECT_EQ(line.back(), '\n');
	EXPECT_EQ(line.find('\n'), line.size() - 1);
	EXPECT_EQ(mcp::codec::decode(line), message);
}

TEST(JsonCodec, DecodeToleratesSurroundingWhitespace) {
	json message = mcp::codec::decode("  \t{\"a\": 1}\r\n");
	EXPECT_EQ(message, json({{"a", 1}}));
}

TEST(JsonCodec, DecodeRejectsInvalidJson) {
	EXPECT_THROW(mcp::codec::decode("not json"), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode("{\"a\": "), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode(""), mcp::MalformedMessage);
}

TEST(JsonCodec, DecodeRejectsNonObjects) {
	EXPECT_THROW(mcp::codec::decode("[1, 2, 3]"), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode("42"), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode("\"text\""), mcp::MalformedMessage);
}

TEST(JsonCodec, NestedValuesSurviveUnchanged) {
	json message = {
		{"list", {1, 2.5, "three", nullptr, true}},
		{"object", {{"inner", {{"deep", json::array()}}}}},
		{"unicode", "Zürich"},
	};
	EXPECT_EQ(mcp::codec::decode(mcp::codec::encode(message)), message);
}

TEST(JsonCodec, RequestCarriesVersionMethodParamsAndId) {
	mcp::Request request;
	request.method = mcp::kMethodCallTool;
	request.params = {{"name", "get_alerts"}, {"arguments", {{"location", "Tokyo"}}}};
	request.id = 7;

	json wire = mcp::codec::decode(mcp::codec::encode_request(request));
	EXPECT_EQ(wire["jsonrpc"], "2.0");
	EXPECT_EQ(wire["method"], "tools/call");
	EXPECT_EQ(wire["id"], 7);
	EXPECT_EQ(wire["params"]["arguments"]["location"], "Tokyo");

	EXPECT_EQ(mcp::codec::decode_request(wire), request);
}

TEST(JsonCodec, DecodeRequestRequiresMethodAndIntegerId) {
	EXPECT_THROW(mcp::codec::decode_request(json{{"jsonrpc", "2.0"}, {"id", 1}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_request(json{{"method", "tools/list"}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_request(json{{"method", "tools/list"}, {"id", "1"}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_request(json{{"method", 5}, {"id", 1}}), mcp::MalformedMessage);
}

TEST(JsonCodec, DecodeRequestDefaultsParamsToEmptyObject) {
	auto request = mcp::codec::decode_request(json{{"jsonrpc", "2.0"}, {"method", "tools/list"}, {"id", 3}});
	EXPECT_TRUE(request.params.is_object());
	EXPECT_TRUE(request.params.empty());
}

TEST(JsonCodec, EncodeResponseWritesNullIdAndNullResult) {
	mcp::Response response;
	json wire = mcp::codec::decode(mcp::codec::encode_response(response));

	EXPECT_TRUE(wire.contains("result"));
	EXPECT_TRUE(wire["result"].is_null());
	EXPECT_TRUE(wire["id"].is_null());
	EXPECT_FALSE(wire.contains("error"));
}

TEST(JsonCodec, EncodeResponsePrefersErrorOverResult) {
	mcp::Response response;
	response.id = 4;
	response.result = json{{"ignored", true}};
	response.error = mcp::ErrorPayload{-32603, "boom"};

	json wire = mcp::codec::decode(mcp::codec::encode_response(response));
	EXPECT_FALSE(wire.contains("result"));
	EXPECT_EQ(wire["error"]["code"], -32603);
	EXPECT_EQ(wire["error"]["message"], "boom");
	EXPECT_EQ(wire["id"], 4);
}

TEST(JsonCodec, DecodeResponseRequiresExactlyOneOfResultAndError) {
	EXPECT_THROW(mcp::codec::decode_response(json{{"jsonrpc", "2.0"}, {"id", 1}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_response(
		json{{"result", 1}, {"error", {{"code", 1}, {"message", "x"}}}, {"id", 1}}), mcp::MalformedMessage);
}

TEST(JsonCodec, DecodeResponseValidatesErrorObjectAndId) {
	EXPECT_THROW(mcp::codec::decode_response(json{{"error", {{"code", "x"}}}, {"id", 1}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_response(json{{"result", 1}, {"id", "abc"}}), mcp::MalformedMessage);

	auto response = mcp::codec::decode_response(json{{"error", {{"code", -32700}, {"message", "Parse error"}}}, {"id", nullptr}});
	ASSERT_TRUE(response.error.has_value());
	EXPECT_EQ(response.error->code, -32700);
	EXPECT_FALSE(response.id.has_value());
}

TEST(JsonCodec, DecodeResponseRejectsErrorCodeOutsideIntRange) {
	EXPECT_THROW(mcp::codec::decode_response(
		json{{"error", {{"code", 4294967296LL}, {"message", "x"}}}, {"id", 1}}), mcp::MalformedMessage);
	EXPECT_THROW(mcp::codec::decode_response(
		json{{"error", {{"code", 18446744073709551615ULL}, {"message", "x"}}}, {"id", 1}}), mcp::MalformedMessage);
}

TEST(JsonCodec, AsInt64SaturatesLargeUnsignedValues) {
	EXPECT_EQ(mcp::codec::as_int64(json(18446744073709551615ULL)), std::numeric_limits<int64_t>::max());
	EXPECT_EQ(mcp::codec::as_int64(json(-5)), -5);
	EXPECT_EQ(mcp::codec::as_int64(json("7"), 3), 3);
}

TEST(JsonCodec, ToolDescriptorUsesInputSchemaKey) {
	mcp::ToolDescriptor descriptor{"get_alerts", "Get weather alerts", json{{"type", "object"}}};
	json wire = mcp::to_json(descriptor);
	EXPECT_EQ(wire["inputSchema"]["type"], "object");

	auto parsed = mcp::tool_descriptor_from_json(wire);
	EXPECT_EQ(parsed.name, "get_alerts");
	EXPECT_EQ(parsed.description, "Get weather alerts");
	EXPECT_THROW(mcp::tool_descriptor_from_json(json{{"description", "nameless"}}), mcp::MalformedMessage);
}

TEST(JsonCodec, DomainErrorSerializesAsErrorField) {
	EXPECT_EQ(mcp::to_json(mcp::ToolResult{mcp::DomainError{"Unknown tool: x"}}), json({{"error", "Unknown tool: x"}}));
	EXPECT_EQ(mcp::to_json(mcp::ToolResult{json{{"aqi", 42}}}), json({{"aqi", 42}}));
}
