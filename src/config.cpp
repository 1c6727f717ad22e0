#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path RUN_DIR = "/tmp";
filesystem::path DATA_DIR = "/grader_data";
filesystem::path STATE_DIR = "/var/lib/code-grader";
const string INPUT_FILENAME = "input.in";
const string OUTPUT_FILENAME = "output.out";
const string WORKDIR_PREFIX = "auto_generated_code_file_";
double TEST_CASE_TIME_LIMIT = 5;
double DESIGN_TIME_LIMIT = 15;
double COMPILE_TIME_LIMIT = 30;
long PENDING_GRACE_SECONDS = 10 * 60;
long MAX_IO_SIZE = 64 * 1024 * 1024;
const string TRUNCATED_MARK = "<...truncated>";
bool DEBUG = false;

}  // namespace grader
