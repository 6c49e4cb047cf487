#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path SCRATCH_DIR = "/tmp/exercise-grader";
filesystem::path PYTHON_EXECUTABLE = "/usr/bin/python3";
int GRACE_MARGIN_MS = 500;
bool USE_CGROUP = false;
string CGROUP_ROOT = "/exercise-grader";
int RUN_USER_ID = -1;
int RUN_GROUP_ID = -1;
bool ISOLATE_NETWORK = true;
int TOTAL_WEIGHT = 100;
int MAX_CONSECUTIVE_INTERNAL_ERRORS = 3;

}  // namespace grader
