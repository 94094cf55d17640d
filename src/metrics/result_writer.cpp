#include "grader/metrics/result_writer.hpp"
#include <glog/logging.h>
#include <sstream>
#include "grader/common/io_utils.hpp"

namespace grader::metrics {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

result_record result_record::from_result(const execution_result &result) {
    result_record record;
    record.task_id = result.task_id;
    record.passed = result.passed();
    record.syntax_valid = result.syntax_valid;
    for (auto &verdict : result.verdicts)
        record.error.push_back(verdict.error);
    record.num_tests = result.num_tests;
    record.num_passed = result.num_passed;
    return record;
}

void to_json(json &j, const result_record &record) {
    json errors = json::array();
    for (auto &error : record.error) {
        if (error)
            errors.push_back(*error);
        else
            errors.push_back(nullptr);
    }
    j = {{"task_id", record.task_id},
         {"passed", record.passed},
         {"syntax_valid", record.syntax_valid},
         {"error", errors},
         {"num_tests", record.num_tests},
         {"num_passed", record.num_passed}};
}

void from_json(const json &j, result_record &record) {
    j.at("task_id").get_to(record.task_id);
    j.at("passed").get_to(record.passed);
    j.at("syntax_valid").get_to(record.syntax_valid);
    j.at("num_tests").get_to(record.num_tests);
    j.at("num_passed").get_to(record.num_passed);
    record.error.clear();
    for (auto &error : j.at("error")) {
        if (error.is_null())
            record.error.emplace_back();
        else
            record.error.emplace_back(error.get<case_error>());
    }
}

void write_results(const fs::path &output_dir, const string &run_name, const vector<execution_result> &results, const evaluation_summary &summary) {
    assert_safe_path(run_name);

    stringstream data;
    for (auto &result : results)
        data << json(result_record::from_result(result)).dump() << '\n';
    write_file_content(output_dir / (run_name + "_data.json"), data.str());

    write_file_content(output_dir / (run_name + "_errors.json"), json(summary.error_histogram).dump(2));
    write_file_content(output_dir / (run_name + "_summary.json"), summary_json(run_name, summary).dump(2));

    LOG(INFO) << "Wrote " << results.size() << " results to " << output_dir / (run_name + "_data.json");
}

vector<result_record> load_results(const fs::path &path) {
    vector<result_record> records;
    stringstream data(read_file_content(path));
    string line;
    while (getline(data, line)) {
        if (line.empty()) continue;
        records.push_back(json::parse(line).get<result_record>());
    }
    return records;
}

}  // namespace grader::metrics
