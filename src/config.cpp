#include "grader/config.hpp"

namespace grader {
using namespace std;

chrono::milliseconds CASE_TIMEOUT = chrono::seconds(10);
chrono::milliseconds HARD_DEADLINE_GRACE = chrono::seconds(5);
unsigned DEFAULT_WORKERS = 4;
filesystem::path OUTPUT_DIR = "evaluated_results";
bool DEBUG = false;

}  // namespace grader
