#include <filesystem>
#include <unistd.h>
#include <sstream>
#include "gtest/gtest.h"
#include "grader/common/io_utils.hpp"
#include "grader/metrics/result_writer.hpp"
#include "grader/metrics/summary.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace grader;
using namespace grader::metrics;
namespace fs = std::filesystem;

static execution_result make_result(const string &task_id, vector<case_verdict> verdicts, bool syntax_valid = true) {
    sandbox_outcome outcome;
    outcome.verdicts = move(verdicts);
    size_t cases = outcome.verdicts.size();
    return execution_result::from_outcome(task_id, syntax_valid, cases, move(outcome));
}

static execution_result load_failure(const string &task_id, size_t cases, const string &kind) {
    sandbox_outcome outcome;
    outcome.load_failed = true;
    outcome.verdicts.push_back(case_verdict::failed(kind, "invalid syntax"));
    return execution_result::from_outcome(task_id, false, cases, move(outcome));
}

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_dir = fs::temp_directory_path() / ("grader-metrics-" + to_string(getpid()));
        fs::remove_all(output_dir);
    }

    void TearDown() override {
        fs::remove_all(output_dir);
    }

    fs::path output_dir;
};

TEST_F(MetricsTest, AggregatesPassRateAndAccuracy) {
    auto ok = case_verdict::accepted();
    vector<execution_result> results = {
        make_result("1", {ok, ok, ok}),
        make_result("2", {ok, ok, ok}),
        make_result("3", {ok, case_verdict::failed("WrongOutput", "4")})};

    evaluation_summary summary = summarize(results);
    EXPECT_EQ(summary.total_problems, 3);
    EXPECT_EQ(summary.passed_problems, 2);
    EXPECT_EQ(summary.failed_problems, 1);
    EXPECT_DOUBLE_EQ(summary.pass_at_1, 2.0 / 3);
    EXPECT_EQ(summary.total_test_cases, 8);
    EXPECT_EQ(summary.passed_test_cases, 7);
    EXPECT_DOUBLE_EQ(summary.test_case_accuracy, 7.0 / 8);
    EXPECT_DOUBLE_EQ(summary.syntax_validity_rate, 1.0);
    EXPECT_EQ(summary.error_histogram, (map<string, size_t>{{"WrongOutput", 1}}));
}

TEST_F(MetricsTest, EmptyRunHasZeroRates) {
    evaluation_summary summary = summarize({});
    EXPECT_EQ(summary.total_problems, 0);
    EXPECT_EQ(summary.pass_at_1, 0.0);
    EXPECT_EQ(summary.test_case_accuracy, 0.0);
    EXPECT_EQ(summary.syntax_validity_rate, 0.0);
    EXPECT_TRUE(summary.error_histogram.empty());
}

TEST_F(MetricsTest, HistogramCountsFirstErrorOfEachFailure) {
    auto ok = case_verdict::accepted();
    vector<execution_result> results = {
        make_result("1", {ok, case_verdict::failed("Timeout", ""), case_verdict::failed("WrongOutput", "1")}),
        make_result("2", {case_verdict::failed("WrongOutput", "1"), case_verdict::failed("Timeout", "")}),
        make_result("3", {ok}),
        make_result("4", {}),
        load_failure("5", 4, "SyntaxError"),
        execution_result::evaluation_error("6", true, "worker exited unexpectedly")};

    evaluation_summary summary = summarize(results);
    EXPECT_EQ(summary.error_histogram, (map<string, size_t>{{"Timeout", 1}, {"WrongOutput", 1}, {"SyntaxError", 1}, {"EvaluationError", 1}}));

    size_t histogram_total = 0;
    for (auto &[name, count] : summary.error_histogram) histogram_total += count;
    EXPECT_EQ(histogram_total, summary.failed_problems);

    // 没有数据点的提交视为通过，加载失败的提交的数据点都视为未通过
    EXPECT_EQ(summary.passed_problems, 2);
    EXPECT_EQ(summary.total_test_cases, 3 + 2 + 1 + 0 + 4 + 0);
    EXPECT_EQ(summary.passed_test_cases, 1 + 0 + 1);
    EXPECT_EQ(summary.syntax_valid_count, 5);
}

TEST_F(MetricsTest, SummaryOrderIndependent) {
    auto ok = case_verdict::accepted();
    vector<execution_result> results = {
        make_result("1", {ok, case_verdict::failed("IndexError", "")}),
        make_result("2", {ok}, false),
        load_failure("3", 2, "SyntaxError")};
    vector<execution_result> reversed(results.rbegin(), results.rend());
    EXPECT_JSON_EQ(summary_json("run", summarize(results)), summary_json("run", summarize(reversed)));
}

TEST_F(MetricsTest, SummaryJsonRoundsRates) {
    auto ok = case_verdict::accepted();
    auto wrong = case_verdict::failed("WrongOutput", "0");
    vector<execution_result> results = {make_result("1", {ok}), make_result("2", {wrong}), make_result("3", {wrong})};

    json expected = {{"model", "model-a"},
                     {"total_problems", 3},
                     {"passed_problems", 1},
                     {"failed_problems", 2},
                     {"pass_at_1", 0.3333},
                     {"test_case_accuracy", 0.3333},
                     {"syntax_validity_rate", 1.0},
                     {"total_test_cases", 3},
                     {"passed_test_cases", 1},
                     {"syntax_valid_count", 3},
                     {"error_breakdown", {{"WrongOutput", 2}}}};
    EXPECT_JSON_EQ(summary_json("model-a", summarize(results)), expected);
    EXPECT_DOUBLE_EQ(round_rate(2.0 / 3), 0.6667);
}

TEST_F(MetricsTest, WritesAndReloadsResults) {
    auto ok = case_verdict::accepted();
    vector<execution_result> results = {
        make_result("a", {ok, case_verdict::failed("WrongStdout", "7\n")}),
        make_result("b", {ok}),
        load_failure("c", 3, "SyntaxError"),
        execution_result::evaluation_error("d", true, "worker exceeded the hard deadline")};
    evaluation_summary summary = summarize(results);

    write_results(output_dir, "run", results, summary);
    ASSERT_TRUE(fs::exists(output_dir / "run_data.json"));
    ASSERT_TRUE(fs::exists(output_dir / "run_errors.json"));
    ASSERT_TRUE(fs::exists(output_dir / "run_summary.json"));

    vector<result_record> records = load_results(output_dir / "run_data.json");
    ASSERT_EQ(records.size(), results.size());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(records[i].task_id, results[i].task_id);
        EXPECT_EQ(records[i].passed, results[i].passed());
        EXPECT_EQ(records[i].syntax_valid, results[i].syntax_valid);
        EXPECT_EQ(records[i].num_tests, results[i].num_tests);
        EXPECT_EQ(records[i].num_passed, results[i].num_passed);
    }
    ASSERT_EQ(records[0].error.size(), 2);
    EXPECT_FALSE(records[0].error[0].has_value());
    EXPECT_EQ(records[0].error[1]->name, "WrongStdout");
    EXPECT_EQ(records[0].error[1]->value, "7\n");

    json errors = json::parse(read_file_content(output_dir / "run_errors.json"));
    EXPECT_JSON_EQ(errors, (json{{"WrongStdout", 1}, {"SyntaxError", 1}, {"EvaluationError", 1}}));

    json written = json::parse(read_file_content(output_dir / "run_summary.json"));
    EXPECT_JSON_EQ(written, summary_json("run", summary));
}

TEST_F(MetricsTest, DataRecordShape) {
    execution_result result = make_result("x", {case_verdict::accepted(), case_verdict::failed("KeyError", "Traceback...")});
    json expected = {{"task_id", "x"},
                     {"passed", false},
                     {"syntax_valid", true},
                     {"error", {nullptr, {{"name", "KeyError"}, {"value", "Traceback..."}}}},
                     {"num_tests", 2},
                     {"num_passed", 1}};
    EXPECT_JSON_EQ(json(result_record::from_result(result)), expected);
}

TEST_F(MetricsTest, RejectsUnsafeRunName) {
    EXPECT_THROW(write_results(output_dir, "../escape", {}, summarize({})), runtime_error);
    EXPECT_THROW(write_results(output_dir, "", {}, summarize({})), runtime_error);
    EXPECT_FALSE(fs::exists(output_dir));
}

TEST_F(MetricsTest, WireFormatPreservesResult) {
    execution_result result = make_result("w", {case_verdict::accepted(), case_verdict::failed("Timeout", "")});
    execution_result decoded = json::parse(json(result).dump()).get<execution_result>();
    EXPECT_EQ(decoded.task_id, "w");
    EXPECT_EQ(decoded.num_tests, 2);
    EXPECT_EQ(decoded.num_passed, 1);
    ASSERT_EQ(decoded.verdicts.size(), 2);
    EXPECT_TRUE(decoded.verdicts[0].passed);
    EXPECT_EQ(decoded.verdicts[1].error->name, "Timeout");
    EXPECT_FALSE(decoded.passed());
}

TEST_F(MetricsTest, ReportListsTopErrors) {
    vector<execution_result> results;
    const vector<pair<string, int>> kinds = {{"WrongOutput", 6}, {"Timeout", 5}, {"IndexError", 4}, {"KeyError", 3}, {"NameError", 2}, {"TypeError", 1}};
    for (auto &[kind, count] : kinds)
        for (int i = 0; i < count; ++i)
            results.push_back(make_result(kind + to_string(i), {case_verdict::failed(kind, "")}));
    results.push_back(make_result("ok", {case_verdict::accepted()}));

    stringstream report;
    print_report(report, "run", summarize(results));
    string text = report.str();
    EXPECT_NE(text.find("EVALUATION RESULTS - run"), string::npos);
    EXPECT_NE(text.find("Total Problems: 22"), string::npos);
    EXPECT_NE(text.find("1/22 problems solved correctly"), string::npos);
    EXPECT_NE(text.find("Top 5 Error Types:"), string::npos);
    EXPECT_NE(text.find("  WrongOutput: 6 (27.27%)"), string::npos);
    EXPECT_NE(text.find("  NameError: 2"), string::npos);
    EXPECT_EQ(text.find("TypeError"), string::npos);
    EXPECT_LT(text.find("WrongOutput: 6"), text.find("Timeout: 5"));
}
