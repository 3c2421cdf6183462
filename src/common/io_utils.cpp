#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const fs::path &path, size_t limit) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

/**
 * @brief 计算从 string[i] 开始的 UTF-8 字符的字节数
 * @return 字节数，如果不是合法的 UTF-8 字符则返回 0
 */
static size_t utf8_sequence_length(const string &string, size_t i) {
    size_t ix = string.length();
    unsigned char c = string[i];
    size_t n;
    if (c <= 0x7f)
        n = 0;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
        return 0;  //U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; j++) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= ix || ((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

string utf8_sanitize(const string &string) {
    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) {
            result += '?';
            ++i;
        } else {
            result.append(string, i, len);
            i += len;
        }
    }
    return result;
}

string truncate_utf8(const string &string, size_t limit) {
    if (string.length() <= limit) return utf8_sanitize(string);
    std::string prefix = string.substr(0, limit);
    // 去掉被截断的最后一个多字节字符
    for (size_t back = 1; back <= 4 && back <= prefix.length(); ++back) {
        size_t i = prefix.length() - back;
        unsigned char c = prefix[i];
        if ((c & 0xC0) == 0x80) continue;
        size_t need = 1;
        if ((c & 0xE0) == 0xC0)
            need = 2;
        else if ((c & 0xF0) == 0xE0)
            need = 3;
        else if ((c & 0xF8) == 0xF0)
            need = 4;
        if (need > back) prefix.resize(i);
        break;
    }
    return utf8_sanitize(prefix);
}

}  // namespace codejudge
