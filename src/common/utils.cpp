#include "grader/common/utils.hpp"
#include <stdlib.h>
#include <cmath>
#include <stdexcept>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

chrono::milliseconds seconds_to_milliseconds(double seconds) {
    if (!isfinite(seconds) || fabs(seconds) > MAX_SECONDS)
        throw out_of_range("time " + to_string(seconds) + "s is out of range");
    return chrono::milliseconds(static_cast<chrono::milliseconds::rep>(seconds * 1000));
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
