#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "sandbox/wire_codec.hpp"

namespace evalbox::sandbox {
namespace {

using lang::Value;

TEST(WireCodecTest, PreservesContainerKinds) {
    auto dict = Value::Dict();
    dict.AsDict()->Set(Value::Tuple({Value::Int(1), Value::Int(2)}), Value::List({Value::Str("x")}));
    auto set = Value::Set();
    set.AsSet()->Add(Value::Int(3));
    const auto original = Value::List({dict, set, Value::Tuple({}), Value::Bool(true), Value::None()});

    const auto decoded = DecodeValue(EncodeValue(original));
    EXPECT_TRUE(lang::Equals(decoded, original));
    EXPECT_EQ(lang::Repr(decoded), "[{(1, 2): ['x']}, {3}, (), True, None]");
}

TEST(WireCodecTest, BoolAndIntStayDistinct) {
    const auto encoded = EncodeValue(Value::Bool(true));
    EXPECT_EQ(encoded["t"], "bool");
    EXPECT_TRUE(DecodeValue(encoded).IsBool());
    EXPECT_TRUE(DecodeValue(EncodeValue(Value::Int(1))).IsInt());
}

TEST(WireCodecTest, NonFiniteFloats) {
    const auto inf = DecodeValue(EncodeValue(Value::Float(std::numeric_limits<double>::infinity())));
    ASSERT_TRUE(inf.IsFloat());
    EXPECT_TRUE(std::isinf(inf.AsDouble()));
    const auto nan = DecodeValue(EncodeValue(Value::Float(std::nan(""))));
    EXPECT_TRUE(std::isnan(nan.AsDouble()));
    EXPECT_EQ(DecodeValue(EncodeValue(Value::Float(0.1))).AsDouble(), 0.1);
}

TEST(WireCodecTest, ExceptionsKeepTheirType) {
    const auto decoded = DecodeValue(EncodeValue(lang::MakeException("KeyError", "missing")));
    ASSERT_EQ(decoded.kind(), lang::ValueKind::kException);
    EXPECT_EQ(decoded.AsException()->type->name, "KeyError");
}

TEST(WireCodecTest, FunctionsCrossAsOpaque) {
    auto builtin = std::make_shared<lang::BuiltinFunction>();
    builtin->name = "len";
    const auto value = Value::FromObject(lang::ValueKind::kBuiltin, builtin);
    const auto encoded = EncodeValue(value);
    EXPECT_EQ(encoded["t"], "opaque");
    const auto decoded = DecodeValue(encoded);
    EXPECT_EQ(decoded.kind(), lang::ValueKind::kOpaque);
    EXPECT_EQ(lang::TypeName(decoded), lang::TypeName(value));
}

TEST(WireCodecTest, RejectsMalformedValues) {
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"v": 1})")), std::invalid_argument);
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"t": "int", "v": "3"})")), std::invalid_argument);
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"t": "float", "v": "abc"})")), std::invalid_argument);
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"t": "dict", "v": [[1]]})")), std::invalid_argument);
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"t": "exctype", "v": "SystemExit"})")),
                 std::invalid_argument);
    EXPECT_THROW(DecodeValue(nlohmann::json::parse(R"({"t": "complex", "v": 1})")), std::invalid_argument);
}

TEST(WireCodecTest, FrozensetStaysFrozen) {
    auto frozen = Value::FrozenSet();
    frozen.AsSet()->Add(Value::Int(1));
    const auto encoded = EncodeValue(frozen);
    EXPECT_EQ(encoded["t"], "frozenset");
    const auto decoded = DecodeValue(encoded);
    EXPECT_EQ(decoded.kind(), lang::ValueKind::kFrozenSet);
    EXPECT_EQ(lang::Repr(decoded), "frozenset({1})");
}

TEST(WireCodecTest, NestingIsBounded) {
    nlohmann::json value;
    value["t"] = "none";
    for (int i = 0; i < 600; ++i) {
        nlohmann::json wrapper;
        wrapper["t"] = "list";
        wrapper["v"] = nlohmann::json::array({value});
        value = std::move(wrapper);
    }
    EXPECT_THROW(DecodeValue(value), std::invalid_argument);

    auto nested = Value::List();
    for (int i = 0; i < 600; ++i) {
        nested = Value::List({nested});
    }
    EXPECT_THROW(EncodeValue(nested), std::invalid_argument);
}

TEST(WireCodecTest, OutcomeFields) {
    const auto outcome = ExecutionOutcome::DefinitionFailure("SyntaxError", "invalid syntax", 3, 7);
    const auto decoded = DecodeOutcome(EncodeOutcome(outcome));
    EXPECT_EQ(decoded.kind, OutcomeKind::kDefinitionFailure);
    EXPECT_EQ(decoded.error_kind, "SyntaxError");
    EXPECT_EQ(decoded.detail, "invalid syntax");
    EXPECT_EQ(decoded.line, 3);
    EXPECT_EQ(decoded.column, 7);

    EXPECT_THROW(DecodeOutcome(nlohmann::json::parse(R"({"kind": "Exploded"})")), std::invalid_argument);
}

TEST(WireCodecTest, CallRequest) {
    WorkerRequest request;
    request.op = "call";
    request.source = "def f(x):\n    return x\n";
    request.target = "f";
    request.args = {Value::Int(5), Value::Str("s")};
    request.limits.timeout_ms = 250;
    request.limits.memory_limit_mb = 64;

    const auto decoded = DecodeRequest(nlohmann::json::parse(DumpJson(EncodeRequest(request))));
    EXPECT_EQ(decoded.op, "call");
    EXPECT_EQ(decoded.target, "f");
    ASSERT_EQ(decoded.args.size(), 2u);
    EXPECT_EQ(decoded.args[1].AsStr(), "s");
    EXPECT_EQ(decoded.limits.timeout_ms, 250);
    EXPECT_EQ(decoded.limits.memory_limit_mb, 64u);
}

TEST(WireCodecTest, RejectsBadRequests) {
    EXPECT_THROW(DecodeRequest(nlohmann::json::parse(R"({"op": "shell", "source": ""})")), std::invalid_argument);
    EXPECT_THROW(DecodeRequest(nlohmann::json::parse(R"({"op": "call", "source": ""})")), std::invalid_argument);
    EXPECT_THROW(DecodeRequest(nlohmann::json::parse(R"({"op": "define"})")), std::invalid_argument);
}

TEST(WireCodecTest, DumpSurvivesInvalidUtf8) {
    nlohmann::json data;
    data["v"] = std::string("ok\xff");
    EXPECT_NO_THROW(DumpJson(data));
}

}  // namespace
}  // namespace evalbox::sandbox
