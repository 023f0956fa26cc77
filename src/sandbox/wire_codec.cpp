#include "sandbox/wire_codec.hpp"

#include <cstdlib>
#include <stdexcept>

namespace evalbox::sandbox {
namespace {

using lang::Value;
using lang::ValueKind;

constexpr int kMaxDepth = 500;

nlohmann::json EncodeItems(const std::vector<Value>& items, int depth);

nlohmann::json EncodeValueAt(const Value& value, int depth) {
    if (depth > kMaxDepth) {
        throw std::invalid_argument("value nested too deeply to encode");
    }
    nlohmann::json out;
    switch (value.kind()) {
        case ValueKind::kNone:
            out["t"] = "none";
            break;
        case ValueKind::kBool:
            out["t"] = "bool";
            out["v"] = value.AsBool();
            break;
        case ValueKind::kInt:
            out["t"] = "int";
            out["v"] = value.AsInt();
            break;
        case ValueKind::kFloat:
            // repr keeps inf and nan, which JSON numbers cannot carry.
            out["t"] = "float";
            out["v"] = lang::FormatFloat(value.AsDouble());
            break;
        case ValueKind::kStr:
            out["t"] = "str";
            out["v"] = value.AsStr();
            break;
        case ValueKind::kList:
            out["t"] = "list";
            out["v"] = EncodeItems(value.AsList()->items, depth);
            break;
        case ValueKind::kTuple:
            out["t"] = "tuple";
            out["v"] = EncodeItems(value.AsTuple()->items, depth);
            break;
        case ValueKind::kSet:
            out["t"] = "set";
            out["v"] = EncodeItems(value.AsSet()->items, depth);
            break;
        case ValueKind::kFrozenSet:
            out["t"] = "frozenset";
            out["v"] = EncodeItems(value.AsSet()->items, depth);
            break;
        case ValueKind::kDict: {
            out["t"] = "dict";
            auto entries = nlohmann::json::array();
            for (const auto& [key, item] : value.AsDict()->entries) {
                entries.push_back(nlohmann::json::array({EncodeValueAt(key, depth + 1), EncodeValueAt(item, depth + 1)}));
            }
            out["v"] = std::move(entries);
            break;
        }
        case ValueKind::kRange: {
            const auto range = value.AsRange();
            out["t"] = "range";
            out["v"] = nlohmann::json::array({range->start, range->stop, range->step});
            break;
        }
        case ValueKind::kExceptionType:
            out["t"] = "exctype";
            out["v"] = value.AsExceptionType()->name;
            break;
        case ValueKind::kException: {
            const auto exception = value.AsException();
            out["t"] = "exception";
            out["type"] = exception->type->name;
            out["v"] = EncodeItems(exception->args, depth);
            break;
        }
        default:
            out["t"] = "opaque";
            out["type"] = lang::TypeName(value);
            out["repr"] = lang::Repr(value);
            break;
    }
    return out;
}

nlohmann::json EncodeItems(const std::vector<Value>& items, int depth) {
    auto out = nlohmann::json::array();
    for (const auto& item : items) {
        out.push_back(EncodeValueAt(item, depth + 1));
    }
    return out;
}

const nlohmann::json& Field(const nlohmann::json& data, const char* name) {
    if (!data.is_object() || !data.contains(name)) {
        throw std::invalid_argument(std::string("missing field '") + name + "'");
    }
    return data.at(name);
}

std::string StringField(const nlohmann::json& data, const char* name) {
    const auto& field = Field(data, name);
    if (!field.is_string()) {
        throw std::invalid_argument(std::string("field '") + name + "' must be a string");
    }
    return field.get<std::string>();
}

const nlohmann::json& ArrayField(const nlohmann::json& data, const char* name) {
    const auto& field = Field(data, name);
    if (!field.is_array()) {
        throw std::invalid_argument(std::string("field '") + name + "' must be an array");
    }
    return field;
}

Value DecodeValueAt(const nlohmann::json& data, int depth);

std::vector<Value> DecodeItems(const nlohmann::json& items, int depth) {
    std::vector<Value> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(DecodeValueAt(item, depth + 1));
    }
    return out;
}

template <typename T>
T OptionalNumber(const nlohmann::json& data, const char* name, T fallback) {
    if (data.is_object() && data.contains(name) && data[name].is_number_integer()) {
        return data[name].get<T>();
    }
    return fallback;
}

Value DecodeValueAt(const nlohmann::json& data, int depth) {
    if (depth > kMaxDepth) {
        throw std::invalid_argument("value nested too deeply to decode");
    }
    const auto tag = StringField(data, "t");
    if (tag == "none") {
        return Value::None();
    }
    if (tag == "bool") {
        const auto& field = Field(data, "v");
        if (!field.is_boolean()) {
            throw std::invalid_argument("bool payload must be a boolean");
        }
        return Value::Bool(field.get<bool>());
    }
    if (tag == "int") {
        const auto& field = Field(data, "v");
        if (!field.is_number_integer()) {
            throw std::invalid_argument("int payload must be an integer");
        }
        return Value::Int(field.get<std::int64_t>());
    }
    if (tag == "float") {
        const auto text = StringField(data, "v");
        char* end = nullptr;
        const double number = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            throw std::invalid_argument("float payload is not a number: " + text);
        }
        return Value::Float(number);
    }
    if (tag == "str") {
        return Value::Str(StringField(data, "v"));
    }
    if (tag == "list") {
        return Value::List(DecodeItems(ArrayField(data, "v"), depth));
    }
    if (tag == "tuple") {
        return Value::Tuple(DecodeItems(ArrayField(data, "v"), depth));
    }
    if (tag == "set" || tag == "frozenset") {
        Value result = tag == "set" ? Value::Set() : Value::FrozenSet();
        for (const auto& item : ArrayField(data, "v")) {
            result.AsSet()->Add(DecodeValueAt(item, depth + 1));
        }
        return result;
    }
    if (tag == "dict") {
        Value result = Value::Dict();
        for (const auto& entry : ArrayField(data, "v")) {
            if (!entry.is_array() || entry.size() != 2) {
                throw std::invalid_argument("dict entries must be [key, value] pairs");
            }
            result.AsDict()->Set(DecodeValueAt(entry[0], depth + 1), DecodeValueAt(entry[1], depth + 1));
        }
        return result;
    }
    if (tag == "range") {
        const auto& bounds = ArrayField(data, "v");
        if (bounds.size() != 3) {
            throw std::invalid_argument("range payload needs start, stop and step");
        }
        return Value::Range(bounds[0].get<std::int64_t>(), bounds[1].get<std::int64_t>(),
                            bounds[2].get<std::int64_t>());
    }
    if (tag == "exctype" || tag == "exception") {
        const auto name = tag == "exctype" ? StringField(data, "v") : StringField(data, "type");
        auto type = lang::FindExceptionType(name);
        if (!type) {
            throw std::invalid_argument("unknown exception type: " + name);
        }
        if (tag == "exctype") {
            return Value::FromExceptionType(std::move(type));
        }
        auto exception = std::make_shared<lang::ExceptionObject>();
        exception->type = std::move(type);
        exception->args = DecodeItems(ArrayField(data, "v"), depth);
        return Value::FromObject(ValueKind::kException, std::move(exception));
    }
    if (tag == "opaque") {
        auto opaque = std::make_shared<lang::OpaqueObject>();
        opaque->type_name = StringField(data, "type");
        opaque->repr = StringField(data, "repr");
        return Value::FromObject(ValueKind::kOpaque, std::move(opaque));
    }
    throw std::invalid_argument("unknown value tag: " + tag);
}

}  // namespace

nlohmann::json EncodeValue(const Value& value) {
    return EncodeValueAt(value, 0);
}

Value DecodeValue(const nlohmann::json& data) {
    return DecodeValueAt(data, 0);
}

nlohmann::json EncodeOutcome(const ExecutionOutcome& outcome) {
    nlohmann::json out;
    out["kind"] = ToString(outcome.kind);
    out["value"] = EncodeValue(outcome.value);
    out["output"] = outcome.output;
    out["errorKind"] = outcome.error_kind;
    out["detail"] = outcome.detail;
    out["line"] = outcome.line;
    out["column"] = outcome.column;
    return out;
}

ExecutionOutcome DecodeOutcome(const nlohmann::json& data) {
    ExecutionOutcome outcome;
    if (!ParseOutcomeKind(StringField(data, "kind"), outcome.kind)) {
        throw std::invalid_argument("unknown outcome kind");
    }
    if (data.contains("value")) {
        outcome.value = DecodeValue(data["value"]);
    }
    outcome.output = data.value("output", std::string());
    outcome.error_kind = data.value("errorKind", std::string());
    outcome.detail = data.value("detail", std::string());
    outcome.line = OptionalNumber<int>(data, "line", 0);
    outcome.column = OptionalNumber<int>(data, "column", 0);
    return outcome;
}

nlohmann::json EncodeRequest(const WorkerRequest& request) {
    nlohmann::json out;
    out["op"] = request.op;
    out["source"] = request.source;
    out["target"] = request.target;
    out["args"] = EncodeItems(request.args, 0);
    out["limits"] = {
        {"maxCallDepth", request.limits.max_call_depth},
        {"maxContainerSize", request.limits.max_container_size},
        {"maxOutputBytes", request.limits.max_output_bytes},
        {"timeoutMs", request.limits.timeout_ms},
        {"memoryLimitMb", request.limits.memory_limit_mb},
    };
    return out;
}

WorkerRequest DecodeRequest(const nlohmann::json& data) {
    WorkerRequest request;
    request.op = StringField(data, "op");
    if (request.op != "define" && request.op != "call") {
        throw std::invalid_argument("unknown op: " + request.op);
    }
    request.source = StringField(data, "source");
    if (data.contains("target") && data["target"].is_string()) {
        request.target = data["target"].get<std::string>();
    }
    if (data.contains("args")) {
        request.args = DecodeItems(ArrayField(data, "args"), 0);
    }
    if (data.contains("limits")) {
        const auto& limits = data["limits"];
        request.limits.max_call_depth = OptionalNumber(limits, "maxCallDepth", request.limits.max_call_depth);
        request.limits.max_container_size =
            OptionalNumber(limits, "maxContainerSize", request.limits.max_container_size);
        request.limits.max_output_bytes = OptionalNumber(limits, "maxOutputBytes", request.limits.max_output_bytes);
        request.limits.timeout_ms = OptionalNumber(limits, "timeoutMs", request.limits.timeout_ms);
        request.limits.memory_limit_mb = OptionalNumber(limits, "memoryLimitMb", request.limits.memory_limit_mb);
    }
    if (request.op == "call" && request.target.empty()) {
        throw std::invalid_argument("call request without target");
    }
    return request;
}

nlohmann::json EncodeResponse(const WorkerResponse& response) {
    nlohmann::json out;
    out["outcome"] = EncodeOutcome(response.outcome);
    out["callables"] = response.callables;
    return out;
}

WorkerResponse DecodeResponse(const nlohmann::json& data) {
    WorkerResponse response;
    response.outcome = DecodeOutcome(Field(data, "outcome"));
    if (data.contains("callables")) {
        for (const auto& name : ArrayField(data, "callables")) {
            if (name.is_string()) {
                response.callables.push_back(name.get<std::string>());
            }
        }
    }
    return response;
}

std::string DumpJson(const nlohmann::json& data) {
    return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace evalbox::sandbox
