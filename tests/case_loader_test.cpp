#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include "judge/case_loader.hpp"

namespace evalbox::judge {
namespace {

TEST(CaseLoaderTest, ConvertsJsonValues) {
    const auto value = ValueFromJson(nlohmann::json::parse(
        R"([null, true, 3, 2.5, "s", [1], {"$tuple": [1, 2]}, {"$set": [1, 1, 2]}, {"k": {"$tuple": []}}])"));
    EXPECT_EQ(lang::Repr(value), "[None, True, 3, 2.5, 's', [1], (1, 2), {1, 2}, {'k': ()}]");
}

TEST(CaseLoaderTest, ObjectsWithOtherKeysStayDicts) {
    const auto value = ValueFromJson(nlohmann::json::parse(R"({"$tuple": [1], "x": 2})"));
    EXPECT_EQ(value.kind(), lang::ValueKind::kDict);
}

TEST(CaseLoaderTest, RejectsOutOfRangeIntegers) {
    EXPECT_THROW(ValueFromJson(nlohmann::json::parse("18446744073709551615")), std::invalid_argument);
}

TEST(CaseLoaderTest, ParsesRequest) {
    const auto request = ParseRequest(nlohmann::json::parse(R"({
        "source": "def add(a, b):\n    return a + b\n",
        "function": "add",
        "test_cases": [[[2, 3], 5], [[-1, 1], 0]]
    })"));
    EXPECT_EQ(request.submission.target_name, "add");
    ASSERT_EQ(request.cases.size(), 2u);
    EXPECT_EQ(request.cases[0].inputs.size(), 2u);
    EXPECT_EQ(request.cases[1].expected.AsInt(), 0);
}

TEST(CaseLoaderTest, RejectsMalformedRequests) {
    EXPECT_THROW(ParseRequest(nlohmann::json::parse("[]")), std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"function": "f", "test_cases": []})")),
                 std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"source": "", "function": "f", "test_cases": [[1, 2]]})")),
                 std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"source": "", "function": "f", "test_cases": [[[1]]]})")),
                 std::invalid_argument);
}

TEST(CaseLoaderTest, LoadRequestFileReportsPath) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("evalbox_request_test_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "{not json";
    }
    try {
        LoadRequestFile(path);
        ADD_FAILURE() << "expected runtime_error";
    } catch (const std::runtime_error& ex) {
        EXPECT_NE(std::string(ex.what()).find(path.string()), std::string::npos);
    }
    std::filesystem::remove(path);

    EXPECT_THROW(LoadRequestFile(path), std::runtime_error);
}

}  // namespace
}  // namespace evalbox::judge
