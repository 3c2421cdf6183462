#include "config.hpp"

namespace codejudge {
using namespace std;

filesystem::path RUN_DIR = "/tmp/codejudge";
filesystem::path CHROOT_DIR;
filesystem::path RUNGUARD = "runguard";
string RUN_USER = "nobody";
string RUN_GROUP;
double COMPILE_TIME_LIMIT = 10;         // 10s
int64_t COMPILE_MEMORY_LIMIT = 1 << 19;  // 512M
size_t OUTPUT_LIMIT = 1 << 20;          // 1M
size_t REPORT_OUTPUT_LIMIT = 1000;
double DEFAULT_TIME_LIMIT = 2;           // 2s
int64_t DEFAULT_MEMORY_LIMIT = 1 << 18;  // 256M
double MAX_TIME_LIMIT = 30;
int64_t MAX_MEMORY_LIMIT = 1 << 20;  // 1G
size_t MAX_SOURCE_SIZE = 1 << 16;    // 64K
size_t MAX_DATA_SIZE = 1 << 24;      // 16M
int PROC_LIMIT = 64;
bool DEBUG = false;

}  // namespace codejudge
