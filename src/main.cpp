#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "grader/common/exceptions.hpp"
#include "grader/common/io_utils.hpp"
#include "grader/common/utils.hpp"
#include "grader/config.hpp"
#include "grader/evaluator.hpp"
#include "grader/loader.hpp"
#include "grader/metrics/result_writer.hpp"
#include "grader/metrics/summary.hpp"
#include "grader/scheduler.hpp"
using namespace std;

void sigint_handler(int /* signum */) {
    grader::stop_workers();
}

/**
 * @brief 默认的评测名为输入文件名去掉 .jsonl/.json 后缀
 */
static string default_run_name(const filesystem::path &generation_file) {
    string name = generation_file.filename().string();
    boost::algorithm::replace_all(name, ".jsonl", "");
    boost::algorithm::replace_all(name, ".json", "");
    return name;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_alsologtostderr = true;

    signal(SIGINT, sigint_handler);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("generation-file", po::value<string>()->required(), "path to the generation results in JSONL format, one submission per line")
        ("workers", po::value<unsigned>(), "set the number of worker processes, clamped to [1, cores - 1], default to 4. You can either pass it from environ WORKERS")
        ("timeout", po::value<double>(), "set the time limit in seconds for each test case, default to 10. You can either pass it from environ CASETIMEOUT")
        ("grace", po::value<double>(), "set the seconds added to the hard deadline of a whole submission, default to 5. You can either pass it from environ HARDDEADLINEGRACE")
        ("output-dir", po::value<string>(), "set the directory to store evaluated results, default to evaluated_results. You can either pass it from environ OUTPUTDIR")
        ("run-name", po::value<string>(), "set the prefix of result files, default to the base name of generation file without .jsonl/.json")
        ("debug", "turn on the debug mode to log the verdicts of every submission.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Grader: Evaluate generated programs against their test cases" << endl
                 << "Usage: " << argv[0] << " --generation-file <path> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("version")) {
            cout << "grader " << GRADER_VERSION << endl;
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug")) {
        grader::DEBUG = true;
    } else if (getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    // 默认的 worker 数量同样受 CPU 核心数限制
    unsigned workers = grader::clamp_workers(grader::DEFAULT_WORKERS, thread::hardware_concurrency());
    try {
        if (vm.count("timeout")) {
            grader::CASE_TIMEOUT = seconds_to_milliseconds(vm["timeout"].as<double>());
        } else if (getenv("CASETIMEOUT")) {
            grader::CASE_TIMEOUT = seconds_to_milliseconds(boost::lexical_cast<double>(getenv("CASETIMEOUT")));
        }

        if (vm.count("grace")) {
            grader::HARD_DEADLINE_GRACE = seconds_to_milliseconds(vm["grace"].as<double>());
        } else if (getenv("HARDDEADLINEGRACE")) {
            grader::HARD_DEADLINE_GRACE = seconds_to_milliseconds(boost::lexical_cast<double>(getenv("HARDDEADLINEGRACE")));
        }

        if (vm.count("workers")) {
            workers = vm["workers"].as<unsigned>();
        } else if (getenv("WORKERS")) {
            workers = boost::lexical_cast<unsigned>(get_env("WORKERS", ""));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (out_of_range& e) {
        cerr << "Invalid time limit: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    CHECK(grader::CASE_TIMEOUT.count() > 0)
        << "Time limit of test cases should be positive";
    CHECK(grader::HARD_DEADLINE_GRACE.count() >= 0)
        << "Grace of hard deadline should not be negative";

    if (vm.count("output-dir")) {
        grader::OUTPUT_DIR = filesystem::path(vm["output-dir"].as<string>());
    } else if (getenv("OUTPUTDIR")) {
        grader::OUTPUT_DIR = filesystem::path(getenv("OUTPUTDIR"));
    }

    filesystem::path generation_file(vm["generation-file"].as<string>());
    string run_name = vm.count("run-name") ? vm["run-name"].as<string>() : default_run_name(generation_file);

    try {
        grader::assert_safe_path(run_name);

        LOG(INFO) << "Loading from " << generation_file;
        vector<grader::candidate_submission> submissions = grader::load_submissions(generation_file);

        grader::worker_pool pool(workers, grader::python_evaluator_factory());
        LOG(INFO) << "Using " << pool.size() << " processes, " << grader::CASE_TIMEOUT.count() << " ms per test case";

        vector<grader::execution_result> results = pool.run(submissions, [](const grader::execution_result&, const grader::progress& p) {
            cerr << "\rEvaluating: " << p.completed << "/" << p.total << flush;
        });
        if (!results.empty()) cerr << endl;

        grader::metrics::evaluation_summary summary = grader::metrics::summarize(results);
        grader::metrics::write_results(grader::OUTPUT_DIR, run_name, results, summary);
        grader::metrics::print_report(cout, run_name, summary);
    } catch (grader::interrupted_error& e) {
        cerr << endl;
        LOG(ERROR) << e.what() << ", no results are written";
        return EXIT_FAILURE;
    } catch (grader::submission_format_error& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    } catch (grader::grader_exception& e) {
        LOG(ERROR) << "Evaluation failed, " << e.what() << endl
                   << e;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Evaluation failed, " << e.what() << endl
                   << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
