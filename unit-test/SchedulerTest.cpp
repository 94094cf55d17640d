#include <map>
#include <set>
#include "gtest/gtest.h"
#include "grader/common/exceptions.hpp"
#include "grader/common/utils.hpp"
#include "grader/config.hpp"
#include "grader/scheduler.hpp"
#include "test/submissions.hpp"
#include "test/worker.hpp"

using namespace std;
using namespace nlohmann;
using namespace grader;

static map<string, execution_result> by_task_id(vector<execution_result> results) {
    map<string, execution_result> indexed;
    for (auto &result : results) indexed.emplace(result.task_id, move(result));
    return indexed;
}

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        case_timeout = CASE_TIMEOUT;
        grace = HARD_DEADLINE_GRACE;
        resume_workers();
    }

    void TearDown() override {
        CASE_TIMEOUT = case_timeout;
        HARD_DEADLINE_GRACE = grace;
        resume_workers();
    }

    chrono::milliseconds case_timeout, grace;
};

TEST_F(SchedulerTest, ClampWorkers) {
    EXPECT_EQ(clamp_workers(4, 8), 4u);
    EXPECT_EQ(clamp_workers(16, 8), 7u);
    EXPECT_EQ(clamp_workers(0, 8), 1u);
    EXPECT_EQ(clamp_workers(4, 2), 1u);
    EXPECT_EQ(clamp_workers(4, 1), 1u);
    EXPECT_EQ(clamp_workers(4, 0), 1u);
}

TEST_F(SchedulerTest, EmptyRun) {
    worker_pool pool(2, scripted_evaluator_factory());
    EXPECT_TRUE(pool.run({}).empty());
}

TEST_F(SchedulerTest, EveryResultArrivesOnce) {
    vector<string> ids;
    for (int i = 0; i < 12; ++i) ids.push_back((i % 3 == 0 ? "fail-" : "pass-") + to_string(i));
    auto submissions = make_submissions(ids);

    vector<size_t> completed;
    worker_pool pool(3, scripted_evaluator_factory());
    auto results = pool.run(submissions, [&](const execution_result &, const progress &p) {
        EXPECT_EQ(p.total, ids.size());
        completed.push_back(p.completed);
    });

    ASSERT_EQ(results.size(), ids.size());
    set<string> seen;
    for (auto &result : results) seen.insert(result.task_id);
    EXPECT_EQ(seen, set<string>(ids.begin(), ids.end()));

    for (size_t i = 0; i < completed.size(); ++i)
        EXPECT_EQ(completed[i], i + 1);

    auto indexed = by_task_id(move(results));
    EXPECT_TRUE(indexed.at("pass-1").passed());
    EXPECT_EQ(indexed.at("pass-1").num_passed, 2);
    EXPECT_FALSE(indexed.at("fail-3").passed());
    EXPECT_EQ(indexed.at("fail-3").first_error_name().value_or(""), "WrongOutput");
}

TEST_F(SchedulerTest, CrashedWorkerIsReplaced) {
    auto submissions = make_submissions({"pass-1", "crash-1", "pass-2", "crash-2", "pass-3", "pass-4"});
    worker_pool pool(2, scripted_evaluator_factory());
    auto indexed = by_task_id(pool.run(submissions));

    ASSERT_EQ(indexed.size(), submissions.size());
    for (const string &id : {"crash-1", "crash-2"}) {
        const execution_result &result = indexed.at(id);
        EXPECT_FALSE(result.passed());
        ASSERT_EQ(result.verdicts.size(), 1);
        EXPECT_EQ(result.verdicts[0].error->name, "EvaluationError");
        EXPECT_EQ(result.verdicts[0].error->value, "worker exited unexpectedly");
        // 语法检查的结果在 worker 崩溃之前已经报告
        EXPECT_TRUE(result.syntax_valid);
        EXPECT_EQ(result.num_tests, 0);
    }
    for (const string &id : {"pass-1", "pass-2", "pass-3", "pass-4"})
        EXPECT_TRUE(indexed.at(id).passed());
}

TEST_F(SchedulerTest, HangingWorkerKilledAtHardDeadline) {
    CASE_TIMEOUT = chrono::milliseconds(100);
    HARD_DEADLINE_GRACE = chrono::milliseconds(100);

    auto submissions = make_submissions({"hang-1", "pass-1", "pass-2"}, 1);
    worker_pool pool(2, scripted_evaluator_factory());
    elapsed_time timer;
    auto indexed = by_task_id(pool.run(submissions));
    auto elapsed = timer.duration<chrono::milliseconds>();

    const execution_result &hang = indexed.at("hang-1");
    ASSERT_EQ(hang.verdicts.size(), 1);
    EXPECT_EQ(hang.verdicts[0].error->name, "EvaluationError");
    EXPECT_NE(hang.verdicts[0].error->value.find("hard deadline"), string::npos);
    EXPECT_TRUE(indexed.at("pass-1").passed());
    EXPECT_TRUE(indexed.at("pass-2").passed());

    // (1 + 1) * 100ms + 100ms
    EXPECT_GE(elapsed.count(), 300);
    EXPECT_LT(elapsed.count(), 5000);
}

TEST_F(SchedulerTest, EvaluatorExceptionBecomesEvaluationError) {
    auto submissions = make_submissions({"throw-1", "invalid-1"});
    worker_pool pool(1, scripted_evaluator_factory());
    auto indexed = by_task_id(pool.run(submissions));

    const execution_result &thrown = indexed.at("throw-1");
    EXPECT_EQ(thrown.verdicts[0].error->name, "EvaluationError");
    EXPECT_EQ(thrown.verdicts[0].error->value, "scripted failure");
    EXPECT_TRUE(thrown.syntax_valid);

    EXPECT_FALSE(indexed.at("invalid-1").syntax_valid);
    EXPECT_TRUE(indexed.at("invalid-1").passed());
}

TEST_F(SchedulerTest, EvaluatorInitializationFailure) {
    auto submissions = make_submissions({"pass-1", "pass-2", "pass-3"});
    worker_pool pool(2, broken_evaluator_factory());
    auto results = pool.run(submissions);

    ASSERT_EQ(results.size(), submissions.size());
    for (auto &result : results) {
        EXPECT_FALSE(result.syntax_valid);
        ASSERT_EQ(result.verdicts.size(), 1);
        EXPECT_EQ(result.verdicts[0].error->name, "EvaluationError");
        EXPECT_NE(result.verdicts[0].error->value.find("no interpreter available"), string::npos);
    }
}

TEST_F(SchedulerTest, StopWorkersInterruptsRun) {
    auto submissions = make_submissions({"pass-1", "hang-1", "hang-2", "hang-3"});
    worker_pool pool(2, scripted_evaluator_factory());

    size_t received = 0;
    EXPECT_THROW(pool.run(submissions, [&](const execution_result &, const progress &) {
        ++received;
        stop_workers();
    }),
                 interrupted_error);
    EXPECT_EQ(received, 1);

    // 恢复之后进程池可以继续使用
    resume_workers();
    auto results = pool.run(make_submissions({"pass-5"}));
    ASSERT_EQ(results.size(), 1);
    EXPECT_TRUE(results[0].passed());
}

class PythonPoolTest : public SchedulerTest {};

TEST_F(PythonPoolTest, EvaluatesScenarios) {
    vector<candidate_submission> submissions = {
        function_submission("A", "def add(a, b):\n    return a + b\n", "add",
                            json::array({json::array({1, 2})}), json::array({3})),
        function_submission("B", "def add(a, b):\n    return 0 if a == 2 else a + b\n", "add",
                            json::array({json::array({1, 2}), json::array({2, 3})}), json::array({3, 5})),
        script_submission("C", "print(5)\n", json::array({""}), json::array({"5"})),
        function_submission("D", "def add(a, b)\n    return a + b\n", "add",
                            json::array({json::array({1, 2}), json::array({2, 3})}), json::array({3, 5})),
        function_submission("E", "import os\ndef add(a, b):\n    os._exit(1)\n", "add",
                            json::array({json::array({1, 2})}), json::array({3}))};

    worker_pool pool(2, python_evaluator_factory());
    auto indexed = by_task_id(pool.run(submissions));
    ASSERT_EQ(indexed.size(), submissions.size());

    EXPECT_TRUE(indexed.at("A").passed());
    EXPECT_EQ(indexed.at("A").num_passed, 1);

    EXPECT_FALSE(indexed.at("B").passed());
    EXPECT_EQ(indexed.at("B").num_passed, 1);
    EXPECT_EQ(indexed.at("B").verdicts[1].error->value, "0");

    EXPECT_TRUE(indexed.at("C").passed());

    EXPECT_FALSE(indexed.at("D").syntax_valid);
    EXPECT_EQ(indexed.at("D").first_error_name().value_or(""), "SyntaxError");
    EXPECT_EQ(indexed.at("D").num_tests, 2);

    // 选手程序退出进程只影响自己的结果
    EXPECT_EQ(indexed.at("E").first_error_name().value_or(""), "EvaluationError");
    EXPECT_TRUE(indexed.at("E").syntax_valid);
}
