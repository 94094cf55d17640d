#include "grader/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <memory>
#include "grader/common/exceptions.hpp"
#include "grader/common/pipe.hpp"
#include "grader/config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static size_t parse_task(const string &line, size_t count) {
    size_t index;
    try {
        index = json::parse(line).at("index").get<size_t>();
    } catch (json::exception &) {
        throw internal_error("Malformed task message: " + line);
    }
    if (index >= count)
        throw internal_error("Task index " + to_string(index) + " is out of range");
    return index;
}

void worker_main(int worker_id, int task_fd, int result_fd, const vector<candidate_submission> &submissions, const evaluator_factory &factory) {
    unique_ptr<evaluator> eval;
    string init_error;
    try {
        eval = factory();
    } catch (std::exception &ex) {
        // 仍然继续读取任务，每个任务都得到 EvaluationError，避免调度器不断重启 worker
        init_error = string("Unable to initialize evaluator: ") + ex.what();
        LOG(ERROR) << "Worker " << worker_id << ": " << init_error << endl
                   << boost::diagnostic_information(ex);
    }

    line_reader reader(task_fd);
    string line;
    while (reader.read_line(line)) {
        size_t index = parse_task(line, submissions.size());
        const candidate_submission &submission = submissions[index];

        bool syntax_valid = false;
        if (eval) {
            try {
                syntax_valid = eval->syntax_valid(submission);
            } catch (std::exception &ex) {
                LOG(WARNING) << "Worker " << worker_id << " failed to check syntax of " << submission << ": " << ex.what();
            }
        }
        write_line(result_fd, json{{"type", "accepted"}, {"index", index}, {"syntax_valid", syntax_valid}}.dump());

        execution_result result;
        if (!eval) {
            result = execution_result::evaluation_error(submission.task_id, syntax_valid, init_error);
        } else {
            try {
                result = eval->evaluate(submission, syntax_valid);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " has crashed when evaluating " << submission << ", " << ex.what() << endl
                           << boost::diagnostic_information(ex);
                result = execution_result::evaluation_error(submission.task_id, syntax_valid, ex.what());
            }
        }

        if (DEBUG)
            LOG(INFO) << "Worker " << worker_id << " evaluated " << submission << ": " << json(result).dump();

        write_line(result_fd, json{{"type", "result"}, {"index", index}, {"result", result}}.dump());
    }
}

}  // namespace grader
