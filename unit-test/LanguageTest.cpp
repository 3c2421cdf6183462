#include "gtest/gtest.h"
#include "judge/language.hpp"

using namespace std;
using namespace codejudge;

class LanguageTest : public ::testing::Test {
};

TEST_F(LanguageTest, ParseTags) {
    EXPECT_EQ(parse_language("c"), language::C);
    EXPECT_EQ(parse_language("cpp"), language::CPP);
    EXPECT_EQ(parse_language("C++"), language::CPP);
    EXPECT_EQ(parse_language("Python"), language::PYTHON);
    EXPECT_EQ(parse_language("py"), language::PYTHON);
    EXPECT_EQ(parse_language("java"), language::JAVA);
    EXPECT_EQ(parse_language("js"), language::JAVASCRIPT);
    EXPECT_EQ(parse_language("golang"), language::GO);
    EXPECT_THROW(parse_language("brainfuck"), invalid_argument);
    EXPECT_THROW(parse_language(""), invalid_argument);

    EXPECT_STREQ(get_language_tag(language::JAVASCRIPT), "javascript");
}

TEST_F(LanguageTest, Profiles) {
    EXPECT_TRUE(get_language_profile(language::CPP).compiled());
    EXPECT_TRUE(get_language_profile(language::JAVA).compiled());
    EXPECT_FALSE(get_language_profile(language::PYTHON).compiled());
    EXPECT_FALSE(get_language_profile(language::JAVASCRIPT).compiled());

    EXPECT_EQ(get_language_profile(language::JAVA).source_file, "Solution.java");
    EXPECT_EQ(get_language_profile(language::PYTHON).out_of_memory_marker, "MemoryError");
}

TEST_F(LanguageTest, ExpandPlaceholders) {
    map<string, string> variables = {{"source", "/w/main.cpp"}, {"executable", "/w/program"}, {"memory_mb", "256"}};
    EXPECT_EQ(expand_placeholders("{executable}", variables), "/w/program");
    EXPECT_EQ(expand_placeholders("-Xmx{memory_mb}m", variables), "-Xmx256m");
    EXPECT_EQ(expand_placeholders("{source} {source}", variables), "/w/main.cpp /w/main.cpp");
    EXPECT_EQ(expand_placeholders("{unknown}", variables), "{unknown}");
}

TEST_F(LanguageTest, Json) {
    nlohmann::json j = language::GO;
    EXPECT_EQ(j, "go");
    EXPECT_EQ(nlohmann::json("c++").get<language>(), language::CPP);
}
