#include <gtest/gtest.h>

#include "parser.hpp"

#include <chrono>

using json = nlohmann::json;

namespace
{
    int64_t millis(SysTime t)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }
}

TEST(Parser, ArrayOfDocuments)
{
    std::vector<LogEntry> out;
    ASSERT_TRUE(parse_documents(R"([{"body":"a"},{"body":"b"}])", out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].body, "a");
    EXPECT_EQ(out[1].body, "b");
}

TEST(Parser, DocumentsWrapperAndSearchHits)
{
    std::vector<LogEntry> out;
    ASSERT_TRUE(parse_documents(R"({"documents":[{"message":"m"}]})", out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].body, "m");

    ASSERT_TRUE(parse_documents(R"({"hits":{"hits":[{"_source":{"body":{"text":"hit"}}}]}})", out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].body, "hit");
}

TEST(Parser, NewlineDelimited)
{
    std::vector<LogEntry> out;
    ASSERT_TRUE(parse_documents("{\"body\":\"one\"}\n\n{\"body\":\"two\"}\n", out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].body, "two");
}

TEST(Parser, BrokenLineIsReported)
{
    std::vector<LogEntry> out;
    std::string err;
    EXPECT_FALSE(parse_documents("{\"body\":\"one\"}\n{oops\n", out, &err));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err.rfind("line 2:", 0), 0u) << err;
}

TEST(Parser, LookupPathMixesNestedAndFlattenedKeys)
{
    const json doc = json::parse(R"({
        "resource": { "attributes": { "service.name": "checkout" } },
        "attributes.http.status": 503,
        "a": { "b": { "c": true } }
    })");

    const json* v = lookup_path(doc, "resource.attributes.service.name");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->get<std::string>(), "checkout");

    v = lookup_path(doc, "attributes.http.status");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->get<int>(), 503);

    v = lookup_path(doc, "a.b.c");
    ASSERT_NE(v, nullptr);
    EXPECT_TRUE(v->get<bool>());

    EXPECT_EQ(lookup_path(doc, "a.b.missing"), nullptr);
    EXPECT_EQ(lookup_path(json::array(), "a"), nullptr);
}

TEST(Parser, ScalarString)
{
    EXPECT_EQ(scalar_string(json("x")), "x");
    EXPECT_EQ(scalar_string(json(42)), "42");
    EXPECT_EQ(scalar_string(json(false)), "false");
    EXPECT_EQ(scalar_string(json(1.5)), "1.5");
    EXPECT_EQ(scalar_string(json::object()), "");
}

TEST(Parser, Timestamps)
{
    SysTime t;
    ASSERT_TRUE(parse_timestamp(json(1700000000123LL), t));
    EXPECT_EQ(millis(t), 1700000000123LL);

    ASSERT_TRUE(parse_timestamp(json("1700000000123"), t));
    EXPECT_EQ(millis(t), 1700000000123LL);

    ASSERT_TRUE(parse_timestamp(json("2023-11-14T22:13:20.123Z"), t));
    EXPECT_EQ(millis(t), 1700000000123LL);

    ASSERT_TRUE(parse_timestamp(json("2023-11-15T00:13:20+02:00"), t));
    EXPECT_EQ(millis(t), 1700000000000LL);

    EXPECT_FALSE(parse_timestamp(json("yesterday"), t));
    EXPECT_FALSE(parse_timestamp(json::object(), t));
}

TEST(Parser, ExtractLogEntry)
{
    const json doc = json::parse(R"({
        "@timestamp": "2023-11-14T22:13:20.123Z",
        "body": { "text": "payment declined" },
        "severity_text": "ERROR",
        "resource": { "attributes": { "service.name": "payments", "deployment.environment": "prod" } },
        "trace_id": "t1"
    })");
    const LogEntry e = extract_entry(doc);
    EXPECT_EQ(millis(e.timestamp), 1700000000123LL);
    EXPECT_EQ(e.body, "payment declined");
    EXPECT_EQ(e.level, "ERROR");
    EXPECT_EQ(e.serviceName, "payments");
    EXPECT_EQ(e.resource, "prod");
    EXPECT_EQ(e.traceId, "t1");
    EXPECT_EQ(e.raw, doc);
}

TEST(Parser, LevelFromSeverityNumber)
{
    EXPECT_EQ(extract_entry(json{ { "severity_number", 13 } }).level, "WARN");
    EXPECT_EQ(extract_entry(json{ { "severity_number", 9 } }).level, "INFO");
    EXPECT_EQ(extract_entry(json{ { "severity_number", 21 } }).level, "FATAL");
}

TEST(Parser, ExtractTransaction)
{
    const json doc = json::parse(R"({
        "name": "GET /cart",
        "attributes": { "processor.event": "transaction" },
        "duration": 2500000,
        "trace_id": "abc",
        "span_id": "s1"
    })");
    const LogEntry e = extract_entry(doc);
    EXPECT_EQ(e.processorEvent, "transaction");
    EXPECT_EQ(e.transactionName, "GET /cart");
    EXPECT_EQ(e.durationNs, 2500000);
    EXPECT_TRUE(e.attributes.is_object());
}

TEST(Parser, FlattenFields)
{
    const json doc = json::parse(R"({"a":{"b":1,"c":{}},"d":"x"})");
    std::vector<std::string> paths;
    flatten_fields(doc, [&](const std::string& p, const json&) { paths.push_back(p); });
    EXPECT_EQ(paths, (std::vector<std::string>{ "a.b", "a.c", "d" }));
}
