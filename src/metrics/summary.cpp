#include "grader/metrics/summary.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace grader::metrics {
using namespace std;
using namespace nlohmann;

static double ratio(size_t numerator, size_t denominator) {
    return denominator > 0 ? (double)numerator / denominator : 0.0;
}

evaluation_summary summarize(const vector<execution_result> &results) {
    evaluation_summary summary;
    summary.total_problems = results.size();
    for (auto &result : results) {
        if (result.passed())
            ++summary.passed_problems;
        else if (auto name = result.first_error_name())
            ++summary.error_histogram[*name];

        summary.total_test_cases += result.num_tests;
        summary.passed_test_cases += result.num_passed;
        if (result.syntax_valid) ++summary.syntax_valid_count;
    }

    summary.failed_problems = summary.total_problems - summary.passed_problems;
    summary.pass_at_1 = ratio(summary.passed_problems, summary.total_problems);
    summary.test_case_accuracy = ratio(summary.passed_test_cases, summary.total_test_cases);
    summary.syntax_validity_rate = ratio(summary.syntax_valid_count, summary.total_problems);
    return summary;
}

double round_rate(double rate) {
    return round(rate * 10000) / 10000;
}

json summary_json(const string &model, const evaluation_summary &summary) {
    return {{"model", model},
            {"total_problems", summary.total_problems},
            {"passed_problems", summary.passed_problems},
            {"failed_problems", summary.failed_problems},
            {"pass_at_1", round_rate(summary.pass_at_1)},
            {"test_case_accuracy", round_rate(summary.test_case_accuracy)},
            {"syntax_validity_rate", round_rate(summary.syntax_validity_rate)},
            {"total_test_cases", summary.total_test_cases},
            {"passed_test_cases", summary.passed_test_cases},
            {"syntax_valid_count", summary.syntax_valid_count},
            {"error_breakdown", summary.error_histogram}};
}

void print_report(ostream &os, const string &model, const evaluation_summary &summary) {
    string heavy(70, '='), light(70, '-');
    os << endl
       << heavy << endl
       << "EVALUATION RESULTS - " << model << endl
       << heavy << endl
       << "Total Problems: " << summary.total_problems << endl
       << endl
       << "KEY METRICS:" << endl
       << light << endl
       << fmt::format("  1. Pass@1:                {:.4f} ({:.2f}%)", summary.pass_at_1, summary.pass_at_1 * 100) << endl
       << fmt::format("     -> {}/{} problems solved correctly", summary.passed_problems, summary.total_problems) << endl
       << endl
       << fmt::format("  2. Test Case Accuracy:    {:.4f} ({:.2f}%)", summary.test_case_accuracy, summary.test_case_accuracy * 100) << endl
       << fmt::format("     -> {}/{} individual test cases passed", summary.passed_test_cases, summary.total_test_cases) << endl
       << endl
       << fmt::format("  3. Syntax Validity Rate:  {:.4f} ({:.2f}%)", summary.syntax_validity_rate, summary.syntax_validity_rate * 100) << endl
       << fmt::format("     -> {}/{} syntactically valid solutions", summary.syntax_valid_count, summary.total_problems) << endl
       << light << endl
       << endl
       << fmt::format("Failures: {} ({:.2f}%)", summary.failed_problems, (1 - summary.pass_at_1) * 100) << endl
       << heavy << endl
       << endl;

    if (summary.error_histogram.empty()) return;

    vector<pair<string, size_t>> errors(summary.error_histogram.begin(), summary.error_histogram.end());
    stable_sort(errors.begin(), errors.end(), [](auto &a, auto &b) { return a.second > b.second; });
    if (errors.size() > 5) errors.resize(5);

    os << "Top 5 Error Types:" << endl;
    for (auto &[name, count] : errors)
        os << fmt::format("  {}: {} ({:.2f}%)", name, count, ratio(count, summary.total_problems) * 100) << endl;
    os << endl;
}

}  // namespace grader::metrics
