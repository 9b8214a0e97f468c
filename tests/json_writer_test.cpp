//! # JSON Writer Tests
//!
//! Tests for the protocol-enforcing writer: output layout in pretty and
//! compact mode, state transitions, protocol violations, session poisoning,
//! delegated writes through serializers, and sink failures.

#include "json/json.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace jemit;
using namespace jemit::json;

namespace {

struct Point {
    int x;
    int y;
};

struct Line {
    Point from;
    Point to;
};

struct Wrapper {
    Point inner;
};

struct Opaque {};

const WriterOptions kCompact{0, true};

// Accepts nothing; with badbit exceptions enabled the stream throws
class RejectingBuffer : public std::streambuf {
protected:
    auto overflow(int_type) -> int_type override {
        return traits_type::eof();
    }

    auto xsputn(const char*, std::streamsize) -> std::streamsize override {
        return 0;
    }
};

class BrokenSink : public OutputSink {
public:
    using OutputSink::write;

    void write(std::string_view) override {
        throw std::runtime_error("disk gone");
    }
    void flush() override {}
};

class ThrowingEncoder : public FieldNameEncoder {
public:
    void encode(std::string_view, OutputSink&) const override {
        throw std::runtime_error("bad name");
    }
};

} // namespace

class JsonWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx = make_rc<SerializerContext>();
        ctx->register_function<Point>([](const Point& p, JsonWriter& out) {
            out.begin_object();
            out.write_property("x", p.x);
            out.write_property("y", p.y);
            out.end_object();
        });
        ctx->register_function<Line>([](const Line& l, JsonWriter& out) {
            out.begin_object();
            out.write_property("from", l.from);
            out.write_property("to", l.to);
            out.end_object();
        });
        ctx->register_function<Wrapper>(
            [](const Wrapper& w, JsonWriter& out) { out.write_value(w.inner); });
    }

    Rc<SerializerContext> ctx;
    StringSink sink;
};

// ============================================================================
// Basic Layout
// ============================================================================

TEST_F(JsonWriterTest, ObjectWithTwoProperties) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    writer.write_property("a", 1);
    writer.write_property("b", "x");
    writer.end_object();

    EXPECT_EQ(sink.str(), "{\n  \"a\": 1,\n  \"b\": \"x\"\n}");
    EXPECT_TRUE(writer.is_complete());
}

TEST_F(JsonWriterTest, ArrayOfIntegers) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    writer.write_value(1);
    writer.write_value(2);
    writer.end_array();

    EXPECT_EQ(sink.str(), "[\n  1,\n  2\n]");
}

TEST_F(JsonWriterTest, EmptyArrayAsPropertyValue) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    writer.write_complex_property("items");
    EXPECT_EQ(writer.state(), JsonWriter::State::ObjectAttr);

    writer.begin_array();
    EXPECT_EQ(writer.state(), JsonWriter::State::Array);
    EXPECT_EQ(writer.depth(), 2u);

    writer.end_array();
    EXPECT_EQ(writer.state(), JsonWriter::State::Object);
    EXPECT_EQ(writer.depth(), 1u);

    writer.end_object();
    EXPECT_EQ(sink.str(), "{\n  \"items\": [\n  ]\n}");
}

TEST_F(JsonWriterTest, TopLevelNull) {
    JsonWriter writer(ctx, sink);
    writer.write_value(nullptr);
    writer.finish();

    EXPECT_EQ(sink.str(), "null");
}

TEST_F(JsonWriterTest, NestedArraysInPrettyMode) {
    std::vector<std::vector<int>> rows{{1}, {2, 3}};
    EXPECT_EQ(to_json(ctx, rows), "[\n   [\n    1\n  ],\n   [\n    2,\n    3\n  ]\n]");
}

TEST_F(JsonWriterTest, CustomIndentFactor) {
    JsonWriter writer(ctx, sink, WriterOptions{4, false});
    writer.begin_array();
    writer.write_value(1);
    writer.end_array();

    EXPECT_EQ(sink.str(), "[\n    1\n]");
}

TEST_F(JsonWriterTest, CompactMode) {
    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_object();
    writer.write_property("a", 1);
    writer.write_complex_property("b");
    writer.begin_array();
    writer.write_value(true);
    writer.write_value(nullptr);
    writer.end_array();
    writer.end_object();

    EXPECT_EQ(sink.str(), "{\"a\":1,\"b\":[true,null]}");
}

TEST_F(JsonWriterTest, RawValue) {
    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_array();
    writer.write_raw_value("{\"pre\":1}");
    writer.write_value(2);
    writer.end_array();

    EXPECT_EQ(sink.str(), "[{\"pre\":1},2]");
}

// ============================================================================
// Scalars and Standard Types
// ============================================================================

TEST_F(JsonWriterTest, Scalars) {
    EXPECT_EQ(to_json(ctx, true), "true");
    EXPECT_EQ(to_json(ctx, false), "false");
    EXPECT_EQ(to_json(ctx, -17), "-17");
    EXPECT_EQ(to_json(ctx, std::numeric_limits<uint64_t>::max()), "18446744073709551615");
    EXPECT_EQ(to_json(ctx, 1.5), "1.5");
    EXPECT_EQ(to_json(ctx, 2.0), "2.0");
    EXPECT_EQ(to_json(ctx, std::nan("")), "null");
    EXPECT_EQ(to_json(ctx, std::string("a\"b\n")), "\"a\\\"b\\n\"");
    EXPECT_EQ(to_json(ctx, std::string_view("view")), "\"view\"");
}

TEST_F(JsonWriterTest, NullCharPointer) {
    const char* missing = nullptr;
    EXPECT_EQ(to_json(ctx, missing), "null");
}

TEST_F(JsonWriterTest, Optionals) {
    EXPECT_EQ(to_json(ctx, std::optional<int>()), "null");
    EXPECT_EQ(to_json(ctx, std::optional<int>(5)), "5");
}

TEST_F(JsonWriterTest, Pointers) {
    Point p{1, 2};
    const Point* none = nullptr;
    EXPECT_EQ(to_json(ctx, none), "null");
    EXPECT_EQ(to_json(ctx, &p, kCompact), "{\"x\":1,\"y\":2}");
    EXPECT_EQ(to_json(ctx, std::make_shared<Point>(p), kCompact), "{\"x\":1,\"y\":2}");
    EXPECT_EQ(to_json(ctx, std::shared_ptr<Point>()), "null");
}

TEST_F(JsonWriterTest, RangesAndMaps) {
    EXPECT_EQ(to_json(ctx, std::vector<int>{1, 2}, kCompact), "[1,2]");
    EXPECT_EQ(to_json(ctx, std::vector<int>{1, 2}), "[\n  1,\n  2\n]");

    std::map<std::string, int> m{{"a", 1}, {"b", 2}};
    EXPECT_EQ(to_json(ctx, m, kCompact), "{\"a\":1,\"b\":2}");

    std::vector<std::optional<std::string>> names{std::string("x"), std::nullopt};
    EXPECT_EQ(to_json(ctx, names, kCompact), "[\"x\",null]");
}

TEST_F(JsonWriterTest, RegisteredStandardTypesReplaceNativeOutput) {
    ctx->register_function<std::vector<int>>(
        [](const std::vector<int>&, JsonWriter& out) { out.write_value("custom-vector"); });
    ctx->register_function<std::map<std::string, int>>(
        [](const std::map<std::string, int>&, JsonWriter& out) { out.write_value("custom-map"); });

    EXPECT_EQ(to_json(ctx, std::vector<int>{1, 2}), "\"custom-vector\"");

    std::map<std::string, int> m{{"a", 1}};
    EXPECT_EQ(to_json(ctx, m), "\"custom-map\"");

    std::vector<std::vector<int>> nested{{1}, {2}};
    EXPECT_EQ(to_json(ctx, nested, kCompact), "[\"custom-vector\",\"custom-vector\"]");

    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_object();
    writer.write_property("values", std::vector<int>{3});
    writer.end_object();
    EXPECT_EQ(sink.str(), "{\"values\":\"custom-vector\"}");

    // Other instantiations keep the built-in rendering
    EXPECT_EQ(to_json(ctx, std::vector<long>{3}, kCompact), "[3]");
}

TEST_F(JsonWriterTest, MarkedStringTypeReplacesNativeOutput) {
    ctx->mark<std::string>(make_serializer<std::string>([](const std::string& s, JsonWriter& out) {
                               out.write_value(static_cast<int64_t>(s.size()));
                           }),
                           Inheritance::ThisType);

    EXPECT_EQ(to_json(ctx, std::string("four")), "4");
    EXPECT_EQ(to_json(ctx, std::string_view("view")), "\"view\"");
}

// ============================================================================
// Protocol Enforcement
// ============================================================================

TEST_F(JsonWriterTest, EndArrayOnFreshSession) {
    JsonWriter writer(ctx, sink);
    EXPECT_THROW(writer.end_array(), ProtocolViolation);
    EXPECT_TRUE(writer.is_poisoned());
    EXPECT_EQ(sink.str(), "");
}

TEST_F(JsonWriterTest, SecondTopLevelValue) {
    JsonWriter writer(ctx, sink);
    writer.write_value(1);
    EXPECT_THROW(writer.write_value(2), ProtocolViolation);
    EXPECT_EQ(sink.str(), "1");
}

TEST_F(JsonWriterTest, SecondTopLevelContainer) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    writer.end_array();
    EXPECT_THROW(writer.begin_object(), ProtocolViolation);
}

TEST_F(JsonWriterTest, ValueWithoutPropertyName) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    EXPECT_THROW(writer.write_value(1), ProtocolViolation);
}

TEST_F(JsonWriterTest, ContainerWithoutPropertyName) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    EXPECT_THROW(writer.begin_array(), ProtocolViolation);
}

TEST_F(JsonWriterTest, PropertyNameInsideArray) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.write_complex_property("x"), ProtocolViolation);
}

TEST_F(JsonWriterTest, PropertyNameTwice) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    writer.write_complex_property("a");
    EXPECT_THROW(writer.write_complex_property("b"), ProtocolViolation);
}

TEST_F(JsonWriterTest, MismatchedEnd) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.end_object(), ProtocolViolation);
}

TEST_F(JsonWriterTest, EndObjectWithPendingValue) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    writer.write_complex_property("a");
    EXPECT_THROW(writer.end_object(), ProtocolViolation);
}

TEST_F(JsonWriterTest, PoisonedSessionRejectsEverything) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.end_object(), ProtocolViolation);

    const std::string before = sink.str();
    try {
        writer.write_value(1);
        FAIL() << "expected ProtocolViolation";
    } catch (const ProtocolViolation& e) {
        EXPECT_NE(e.message().find("poisoned"), std::string::npos);
    }
    EXPECT_THROW(writer.end_array(), ProtocolViolation);
    EXPECT_EQ(sink.str(), before);
    EXPECT_FALSE(writer.is_complete());
}

TEST_F(JsonWriterTest, FinishRequiresCompleteDocument) {
    {
        JsonWriter writer(ctx, sink);
        EXPECT_FALSE(writer.is_complete());
        EXPECT_THROW(writer.finish(), ProtocolViolation);
    }
    {
        JsonWriter writer(ctx, sink);
        writer.begin_array();
        EXPECT_FALSE(writer.is_complete());
        EXPECT_THROW(writer.finish(), ProtocolViolation);
    }
}

TEST_F(JsonWriterTest, NullContextRejected) {
    EXPECT_THROW({ JsonWriter writer(nullptr, sink); }, std::invalid_argument);
}

TEST(JsonWriterStateTest, StateNames) {
    EXPECT_STREQ(state_name(JsonWriter::State::Unknown), "UNKNOWN");
    EXPECT_STREQ(state_name(JsonWriter::State::Array), "ARRAY");
    EXPECT_STREQ(state_name(JsonWriter::State::Object), "OBJECT");
    EXPECT_STREQ(state_name(JsonWriter::State::ObjectAttr), "OBJATTR");
}

// ============================================================================
// Delegated Writes
// ============================================================================

TEST_F(JsonWriterTest, RegisteredObjectAsPropertyValue) {
    JsonWriter writer(ctx, sink);
    writer.begin_object();
    writer.write_complex_property("p");
    writer.write_value(Point{1, 2});
    writer.end_object();

    EXPECT_EQ(sink.str(), "{\n  \"p\": {\n    \"x\": 1,\n    \"y\": 2\n  }\n}");
}

TEST_F(JsonWriterTest, RegisteredObjectsInArray) {
    std::vector<Point> points{{1, 2}, {3, 4}};
    EXPECT_EQ(to_json(ctx, points),
              "[\n   {\n    \"x\": 1,\n    \"y\": 2\n  },\n   {\n    \"x\": 3,\n    \"y\": 4\n  }\n]");
    EXPECT_EQ(to_json(ctx, points, kCompact), "[{\"x\":1,\"y\":2},{\"x\":3,\"y\":4}]");
}

TEST_F(JsonWriterTest, SerializerWritingNestedObjects) {
    Line line{{1, 2}, {3, 4}};
    EXPECT_EQ(to_json(ctx, line, kCompact),
              "{\"from\":{\"x\":1,\"y\":2},\"to\":{\"x\":3,\"y\":4}}");
}

TEST_F(JsonWriterTest, SerializerHandingValueToAnother) {
    EXPECT_EQ(to_json(ctx, Wrapper{{5, 6}}, kCompact), "{\"x\":5,\"y\":6}");

    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_array();
    writer.write_value(Wrapper{{1, 1}});
    writer.write_value(Wrapper{{2, 2}});
    writer.end_array();
    EXPECT_EQ(sink.str(), "[{\"x\":1,\"y\":1},{\"x\":2,\"y\":2}]");
}

TEST_F(JsonWriterTest, SerializerWritingScalar) {
    struct Celsius {
        double degrees;
    };
    ctx->register_function<Celsius>(
        [](const Celsius& c, JsonWriter& out) { out.write_value(c.degrees); });

    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_object();
    writer.write_property("t", Celsius{21.5});
    writer.write_property("n", 1);
    writer.end_object();

    EXPECT_EQ(sink.str(), "{\"t\":21.5,\"n\":1}");
}

TEST_F(JsonWriterTest, UnresolvedType) {
    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.write_value(Opaque{}), UnresolvedTypeError);
    EXPECT_TRUE(writer.is_poisoned());
}

TEST_F(JsonWriterTest, SerializerWritingNothing) {
    ctx->register_function<Opaque>([](const Opaque&, JsonWriter&) {});

    JsonWriter writer(ctx, sink);
    try {
        writer.write_value(Opaque{});
        FAIL() << "expected StrategyInvocationError";
    } catch (const StrategyInvocationError& e) {
        EXPECT_NE(e.message().find("did not write a value"), std::string::npos);
    }
    EXPECT_TRUE(writer.is_poisoned());
}

TEST_F(JsonWriterTest, SerializerWritingTwoValues) {
    ctx->register_function<Opaque>([](const Opaque&, JsonWriter& out) {
        out.write_value(1);
        out.write_value(2);
    });

    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.write_value(Opaque{}), ProtocolViolation);
}

TEST_F(JsonWriterTest, SerializerLeavingContainerOpen) {
    ctx->register_function<Opaque>([](const Opaque&, JsonWriter& out) { out.begin_object(); });

    JsonWriter writer(ctx, sink);
    try {
        writer.write_value(Opaque{});
        FAIL() << "expected StrategyInvocationError";
    } catch (const StrategyInvocationError& e) {
        EXPECT_NE(e.message().find("left 1 container(s) open"), std::string::npos);
    }
}

TEST_F(JsonWriterTest, SerializerClosingEnclosingContainer) {
    ctx->register_function<Opaque>([](const Opaque&, JsonWriter& out) { out.end_array(); });

    JsonWriter writer(ctx, sink);
    writer.begin_array();
    EXPECT_THROW(writer.write_value(Opaque{}), ProtocolViolation);
}

TEST_F(JsonWriterTest, SerializerThrowing) {
    ctx->register_function<Opaque>(
        [](const Opaque&, JsonWriter&) { throw std::runtime_error("boom"); });

    JsonWriter writer(ctx, sink);
    try {
        writer.write_value(Opaque{});
        FAIL() << "expected StrategyInvocationError";
    } catch (const StrategyInvocationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StrategyInvocation);
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
        ASSERT_TRUE(e.cause());
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::runtime_error);
    }
    EXPECT_TRUE(writer.is_poisoned());
}

// ============================================================================
// Property Names and Sinks
// ============================================================================

TEST_F(JsonWriterTest, RelaxedPropertyNames) {
    ctx->set_field_name_encoder(make_rc<IdentifierFieldNameEncoder>());

    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_object();
    writer.write_property("name", "x");
    writer.write_property("two words", 1);
    writer.end_object();

    EXPECT_EQ(sink.str(), "{name:\"x\",\"two words\":1}");
}

TEST_F(JsonWriterTest, FailingStreamPoisonsSession) {
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    StreamSink failing(os);

    JsonWriter writer(ctx, failing);
    EXPECT_THROW(writer.write_value(1), SinkIOError);
    EXPECT_TRUE(writer.is_poisoned());
    EXPECT_THROW(writer.write_value(1), ProtocolViolation);
}

TEST_F(JsonWriterTest, ThrowingStreamReportsSinkError) {
    RejectingBuffer buffer;
    std::ostream os(&buffer);
    os.exceptions(std::ios::badbit);
    StreamSink failing(os);

    JsonWriter writer(ctx, failing);
    EXPECT_THROW(writer.write_value(1), SinkIOError);
    EXPECT_TRUE(writer.is_poisoned());
}

TEST_F(JsonWriterTest, ThrowingStreamInsideSerializerReportsSinkError) {
    RejectingBuffer buffer;
    std::ostream os(&buffer);
    os.exceptions(std::ios::badbit);
    StreamSink failing(os);

    JsonWriter writer(ctx, failing);
    try {
        writer.write_value(Point{1, 2});
        FAIL() << "expected SinkIOError";
    } catch (const SinkIOError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SinkIO);
    }
    EXPECT_TRUE(writer.is_poisoned());
}

TEST_F(JsonWriterTest, ForeignSinkExceptionBecomesSinkError) {
    BrokenSink broken;

    JsonWriter top(ctx, broken);
    EXPECT_THROW(top.write_value(1), SinkIOError);
    EXPECT_TRUE(top.is_poisoned());

    JsonWriter nested(ctx, broken);
    try {
        nested.write_value(Line{{1, 2}, {3, 4}});
        FAIL() << "expected SinkIOError";
    } catch (const SinkIOError& e) {
        EXPECT_NE(e.message().find("disk gone"), std::string::npos);
    }
    EXPECT_TRUE(nested.is_poisoned());
}

TEST_F(JsonWriterTest, FailingFieldNameEncoder) {
    ctx->set_field_name_encoder(make_rc<ThrowingEncoder>());

    JsonWriter writer(ctx, sink, kCompact);
    writer.begin_object();
    try {
        writer.write_property("a", 1);
        FAIL() << "expected StrategyInvocationError";
    } catch (const StrategyInvocationError& e) {
        EXPECT_NE(e.message().find("bad name"), std::string::npos);
        EXPECT_TRUE(e.cause());
    }
    EXPECT_TRUE(writer.is_poisoned());
    EXPECT_EQ(sink.str(), "{");
    EXPECT_THROW(writer.end_object(), ProtocolViolation);
}

TEST_F(JsonWriterTest, StreamSinkOutput) {
    std::ostringstream os;
    StreamSink out(os);

    JsonWriter writer(ctx, out, kCompact);
    writer.write_value(std::vector<int>{1, 2, 3});
    writer.finish();

    EXPECT_EQ(os.str(), "[1,2,3]");
}
