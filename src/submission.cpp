#include "grader/submission.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_spec &spec) {
    if (!j.is_object())
        throw invalid_argument("input_output is not an object");
    if (!j.count("inputs") || !j.count("outputs"))
        throw invalid_argument("input_output is missing inputs/outputs");

    const json &inputs = j.at("inputs");
    const json &outputs = j.at("outputs");
    if (!inputs.is_array() || !outputs.is_array())
        throw invalid_argument("inputs/outputs must be lists");
    if (inputs.size() != outputs.size())
        throw invalid_argument(fmt::format("input/output length mismatch: {} inputs, {} outputs", inputs.size(), outputs.size()));

    spec.entry_point.reset();
    if (j.count("fn_name") && !j.at("fn_name").is_null()) {
        if (!j.at("fn_name").is_string())
            throw invalid_argument("fn_name must be a string");
        string fn_name = j.at("fn_name").get<string>();
        // 空函数名当作脚本模式
        if (!fn_name.empty()) spec.entry_point = fn_name;
    }

    spec.cases.clear();
    for (size_t i = 0; i < inputs.size(); ++i)
        spec.cases.push_back({inputs[i], outputs[i]});
}

test_spec parse_test_spec(const string &input_output) {
    json j;
    try {
        j = json::parse(input_output);
    } catch (json::parse_error &e) {
        throw invalid_argument(string("input_output is not valid JSON: ") + e.what());
    }
    return j.get<test_spec>();
}

bool candidate_submission::valid() const {
    return invalid_reason.empty();
}

}  // namespace grader
