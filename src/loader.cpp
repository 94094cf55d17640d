#include "grader/loader.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <sstream>
#include <system_error>
#include "grader/common/exceptions.hpp"
#include "grader/common/io_utils.hpp"
#include "grader/common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static string as_text(const json &value) {
    if (value.is_string()) return value.get<string>();
    if (value.is_null()) return "";
    return value.dump();
}

static string read_task_id(const json &j) {
    if (exists(j, "task_id")) return as_text(j.at("task_id"));
    if (exists(j, "id")) return as_text(j.at("id"));
    return "unknown";
}

static string read_code(const json &j) {
    json code;
    for (const char *key : {"candidate_code", "deal_response", "solutions"}) {
        if (exists(j, key)) {
            code = j.at(key);
            break;
        }
    }
    if (code.is_array()) return code.empty() ? "" : as_text(code.front());
    return as_text(code);
}

candidate_submission parse_submission(const json &j) {
    candidate_submission submission;
    submission.task_id = read_task_id(j);
    submission.candidate_code = read_code(j);

    json input_output = access_optional(j, "input_output");
    try {
        if (input_output.is_string())
            submission.spec = parse_test_spec(input_output.get<string>());
        else if (input_output.is_object())
            submission.spec = input_output.get<test_spec>();
        else
            throw invalid_argument("input_output is missing");
    } catch (invalid_argument &ex) {
        submission.invalid_reason = ex.what();
    } catch (json::exception &ex) {
        submission.invalid_reason = ex.what();
    }
    return submission;
}

vector<candidate_submission> load_submissions(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        throw submission_format_error("Unable to read generation file " + path.string() + ": " + ex.what());
    }

    vector<candidate_submission> submissions;
    stringstream stream(content);
    string line;
    for (size_t line_num = 1; getline(stream, line); ++line_num) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;

        json j;
        try {
            j = json::parse(line);
        } catch (json::parse_error &ex) {
            LOG(WARNING) << "Skipping malformed line " << line_num << ": " << ex.what();
            continue;
        }
        if (!j.is_object()) {
            LOG(WARNING) << "Skipping malformed line " << line_num << ": not a JSON object";
            continue;
        }

        if (submissions.empty()) {
            vector<string> keys;
            for (auto &item : j.items()) keys.push_back(item.key());
            LOG(INFO) << "First item keys: " << boost::algorithm::join(keys, ", ");
        }

        submissions.push_back(parse_submission(j));
        if (!submissions.back().valid())
            LOG(WARNING) << submissions.back() << " on line " << line_num << " has an invalid test specification: " << submissions.back().invalid_reason;
    }

    LOG(INFO) << "Loaded " << submissions.size() << " submissions from " << path;
    if (!submissions.empty() && submissions.front().candidate_code.empty())
        LOG(WARNING) << "The first submission has no code, check the candidate_code/deal_response/solutions fields";
    return submissions;
}

}  // namespace grader
