#include "judge/language.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<string, language> language_tags = boost::assign::map_list_of
    ("c", language::C)
    ("cpp", language::CPP)
    ("c++", language::CPP)
    ("python", language::PYTHON)
    ("py", language::PYTHON)
    ("java", language::JAVA)
    ("javascript", language::JAVASCRIPT)
    ("js", language::JAVASCRIPT)
    ("go", language::GO)
    ("golang", language::GO);

static const unordered_map<language, const char *> language_names = boost::assign::map_list_of
    (language::C, "c")
    (language::CPP, "cpp")
    (language::PYTHON, "python")
    (language::JAVA, "java")
    (language::JAVASCRIPT, "javascript")
    (language::GO, "go");
// clang-format on

static const unordered_map<language, language_profile> profiles = {
    {language::C,
     {"main.c",
      {"gcc", "-x", "c", "-std=c11", "-O2", "-o", "{executable}", "{source}", "-lm"},
      {"{executable}"},
      {},
      ""}},
    {language::CPP,
     {"main.cpp",
      {"g++", "-x", "c++", "-std=c++17", "-O2", "-o", "{executable}", "{source}"},
      {"{executable}"},
      {},
      ""}},
    {language::PYTHON,
     {"main.py",
      {},
      {"python3", "{source}"},
      {{"PYTHONDONTWRITEBYTECODE", "1"}, {"PYTHONIOENCODING", "utf-8"}},
      "MemoryError"}},
    {language::JAVA,
     {"Solution.java",
      {"javac", "-encoding", "UTF-8", "-J-Xmx256m", "-d", "{workdir}", "{source}"},
      {"java", "-Xmx{memory_mb}m", "-Xss64m", "-XX:+UseSerialGC", "-cp", "{workdir}", "Solution"},
      {},
      "java.lang.OutOfMemoryError"}},
    {language::JAVASCRIPT,
     {"main.js",
      {},
      {"node", "--max-old-space-size={memory_mb}", "{source}"},
      {},
      "JavaScript heap out of memory"}},
    {language::GO,
     {"main.go",
      {"go", "build", "-o", "{executable}", "{source}"},
      {"{executable}"},
      {{"GOCACHE", "{workdir}/.cache"}, {"GOMODCACHE", "{workdir}/.modcache"}, {"GOPATH", "{workdir}/.gopath"}, {"CGO_ENABLED", "0"}},
      ""}}};

language parse_language(const string &tag) {
    auto it = language_tags.find(boost::algorithm::to_lower_copy(tag));
    if (it == language_tags.end())
        throw invalid_argument("unsupported language " + tag);
    return it->second;
}

const char *get_language_tag(language lang) {
    return language_names.at(lang);
}

const language_profile &get_language_profile(language lang) {
    return profiles.at(lang);
}

string expand_placeholders(const string &text, const map<string, string> &variables) {
    string result = text;
    for (auto &[name, value] : variables)
        boost::algorithm::replace_all(result, "{" + name + "}", value);
    return result;
}

void to_json(nlohmann::json &j, const language &lang) {
    j = get_language_tag(lang);
}

void from_json(const nlohmann::json &j, language &lang) {
    lang = parse_language(j.get<string>());
}

}  // namespace codejudge
