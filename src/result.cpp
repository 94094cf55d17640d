#include "grader/result.hpp"
#include <algorithm>
#include "grader/common/status.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const case_error &error) {
    j = {{"name", error.name}, {"value", error.value}};
}

void from_json(const json &j, case_error &error) {
    j.at("name").get_to(error.name);
    j.at("value").get_to(error.value);
}

case_verdict case_verdict::accepted() {
    return {true, nullopt};
}

case_verdict case_verdict::failed(const string &name, const string &value) {
    return {false, case_error{name, value}};
}

bool execution_result::passed() const {
    return all_of(verdicts.begin(), verdicts.end(), [](const case_verdict &v) { return v.passed; });
}

optional<string> execution_result::first_error_name() const {
    if (passed()) return nullopt;
    for (auto &verdict : verdicts)
        if (verdict.error) return verdict.error->name;
    return nullopt;
}

execution_result execution_result::from_outcome(const string &task_id, bool syntax_valid, size_t num_cases, sandbox_outcome &&outcome) {
    execution_result result;
    result.task_id = task_id;
    result.syntax_valid = syntax_valid;
    result.load_failed = outcome.load_failed;
    result.verdicts = move(outcome.verdicts);
    result.num_tests = outcome.load_failed ? num_cases : result.verdicts.size();
    result.num_passed = outcome.load_failed ? 0 : count_if(result.verdicts.begin(), result.verdicts.end(), [](const case_verdict &v) { return v.passed; });
    return result;
}

execution_result execution_result::evaluation_error(const string &task_id, bool syntax_valid, const string &message) {
    execution_result result;
    result.task_id = task_id;
    result.syntax_valid = syntax_valid;
    result.load_failed = true;
    result.verdicts.push_back(case_verdict::failed(get_error_name(error_kind::EVALUATION_ERROR), message));
    return result;
}

void to_json(json &j, const execution_result &result) {
    json errors = json::array();
    json passes = json::array();
    for (auto &verdict : result.verdicts) {
        passes.push_back(verdict.passed);
        if (verdict.error)
            errors.push_back(*verdict.error);
        else
            errors.push_back(nullptr);
    }
    j = {{"task_id", result.task_id},
         {"syntax_valid", result.syntax_valid},
         {"load_failed", result.load_failed},
         {"verdicts", passes},
         {"errors", errors},
         {"num_tests", result.num_tests},
         {"num_passed", result.num_passed}};
}

void from_json(const json &j, execution_result &result) {
    j.at("task_id").get_to(result.task_id);
    j.at("syntax_valid").get_to(result.syntax_valid);
    j.at("load_failed").get_to(result.load_failed);
    j.at("num_tests").get_to(result.num_tests);
    j.at("num_passed").get_to(result.num_passed);

    const json &passes = j.at("verdicts");
    const json &errors = j.at("errors");
    if (passes.size() != errors.size())
        throw invalid_argument("verdicts and errors are not aligned");
    result.verdicts.clear();
    for (size_t i = 0; i < passes.size(); ++i) {
        case_verdict verdict;
        verdict.passed = passes[i].get<bool>();
        if (!errors[i].is_null()) verdict.error = errors[i].get<case_error>();
        result.verdicts.push_back(move(verdict));
    }
}

}  // namespace grader
