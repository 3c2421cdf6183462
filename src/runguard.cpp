#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        auto end = line.find(": ");
        if (end == string::npos) {
            // "key:" 表示值为空
            if (!line.empty() && line.back() == ':')
                mp[line.substr(0, line.length() - 1)] = "";
            continue;
        }
        // 同一个 key 出现多次时以最后一次为准
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 保留默认值
    }
}

template <>
void try_to_parse(const map<string, string> &metadata, const string &key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    if (!filesystem::exists(metafile))
        throw internal_error("runguard did not produce meta file " + metafile.string());

    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    try_to_parse(metadata, "internal-error", result.internal_error);
    return result;
}

}  // namespace codejudge
