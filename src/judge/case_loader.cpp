#include "judge/case_loader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace evalbox::judge {
namespace {

std::vector<lang::Value> ValuesFromArray(const nlohmann::json& items) {
    std::vector<lang::Value> values;
    values.reserve(items.size());
    for (const auto& item : items) {
        values.push_back(ValueFromJson(item));
    }
    return values;
}

bool IsTagged(const nlohmann::json& data, const char* tag) {
    return data.is_object() && data.size() == 1 && data.contains(tag) && data[tag].is_array();
}

}  // namespace

lang::Value ValueFromJson(const nlohmann::json& data) {
    switch (data.type()) {
        case nlohmann::json::value_t::null:
            return lang::Value::None();
        case nlohmann::json::value_t::boolean:
            return lang::Value::Bool(data.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return lang::Value::Int(data.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            const auto value = data.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw std::invalid_argument("integer out of range: " + data.dump());
            }
            return lang::Value::Int(static_cast<std::int64_t>(value));
        }
        case nlohmann::json::value_t::number_float:
            return lang::Value::Float(data.get<double>());
        case nlohmann::json::value_t::string:
            return lang::Value::Str(data.get<std::string>());
        case nlohmann::json::value_t::array:
            return lang::Value::List(ValuesFromArray(data));
        case nlohmann::json::value_t::object: {
            if (IsTagged(data, "$tuple")) {
                return lang::Value::Tuple(ValuesFromArray(data["$tuple"]));
            }
            if (IsTagged(data, "$set")) {
                auto result = lang::Value::Set();
                for (const auto& item : data["$set"]) {
                    result.AsSet()->Add(ValueFromJson(item));
                }
                return result;
            }
            auto result = lang::Value::Dict();
            for (const auto& [key, item] : data.items()) {
                result.AsDict()->Set(lang::Value::Str(key), ValueFromJson(item));
            }
            return result;
        }
        default:
            break;
    }
    throw std::invalid_argument("unsupported JSON value: " + data.dump());
}

EvaluationRequest ParseRequest(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    if (!data.contains("source") || !data["source"].is_string()) {
        throw std::invalid_argument("request needs a string 'source'");
    }
    if (!data.contains("function") || !data["function"].is_string()) {
        throw std::invalid_argument("request needs a string 'function'");
    }
    if (!data.contains("test_cases") || !data["test_cases"].is_array()) {
        throw std::invalid_argument("request needs an array 'test_cases'");
    }

    EvaluationRequest request;
    request.submission.source = data["source"].get<std::string>();
    request.submission.target_name = data["function"].get<std::string>();
    std::size_t index = 0;
    for (const auto& entry : data["test_cases"]) {
        if (!entry.is_array() || entry.size() != 2 || !entry[0].is_array()) {
            throw std::invalid_argument("test case " + std::to_string(index) + " must be [[inputs...], expected]");
        }
        TestCase test_case;
        test_case.inputs = ValuesFromArray(entry[0]);
        test_case.expected = ValueFromJson(entry[1]);
        request.cases.push_back(std::move(test_case));
        ++index;
    }
    return request;
}

EvaluationRequest LoadRequestFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    nlohmann::json data;
    try {
        input >> data;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("invalid JSON in " + path.string() + ": " + ex.what());
    }
    try {
        return ParseRequest(data);
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(path.string() + ": " + ex.what());
    }
}

}  // namespace evalbox::judge
