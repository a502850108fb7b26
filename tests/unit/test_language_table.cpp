#include <gtest/gtest.h>
#include "language_table.h"

using namespace capsulerun;

TEST(LanguageTableTest, FindsByNameAndAlias) {
    const LanguageSpec* python = LanguageTable::find("python");
    ASSERT_NE(python, nullptr);
    EXPECT_EQ(python->runtime, "python");
    EXPECT_EQ(python->version, "3.10.0");
    EXPECT_EQ(python->filename, "main.py");

    EXPECT_EQ(LanguageTable::find("Python3"), python);
    EXPECT_EQ(LanguageTable::find("py"), python);
    EXPECT_EQ(LanguageTable::find("node")->name, "javascript");
    EXPECT_EQ(LanguageTable::find("C#")->name, "csharp");
}

TEST(LanguageTableTest, SandboxRuntimeNamesDifferWhereNeeded) {
    EXPECT_EQ(LanguageTable::find("cpp")->runtime, "c++");
    EXPECT_EQ(LanguageTable::find("c++")->name, "cpp");
    EXPECT_EQ(LanguageTable::find("sql")->runtime, "sqlite3");
    EXPECT_EQ(LanguageTable::find("java")->filename, "Main.java");
}

TEST(LanguageTableTest, UnknownLanguageIsNull) {
    EXPECT_EQ(LanguageTable::find("cobol"), nullptr);
    EXPECT_EQ(LanguageTable::find(""), nullptr);
    EXPECT_FALSE(LanguageTable::is_executable("cobol"));
}

TEST(LanguageTableTest, GenerationIsASubsetOfExecution) {
    for (const auto& spec : LanguageTable::all()) {
        EXPECT_TRUE(spec.executable) << spec.name;
    }
    EXPECT_TRUE(LanguageTable::is_generatable("python"));
    EXPECT_TRUE(LanguageTable::is_generatable("sql"));
    EXPECT_FALSE(LanguageTable::is_generatable("rust"));
    EXPECT_TRUE(LanguageTable::is_executable("rust"));
}

TEST(LanguageTableTest, OnlyPythonAndJavascriptHaveHarnesses) {
    for (const auto& spec : LanguageTable::all()) {
        bool expected = spec.name == "python" || spec.name == "javascript";
        EXPECT_EQ(spec.harness_template != nullptr, expected) << spec.name;
    }
}

TEST(LanguageTableTest, NameListsForErrors) {
    std::string gen = LanguageTable::generatable_names();
    EXPECT_NE(gen.find("python"), std::string::npos);
    EXPECT_EQ(gen.find("rust"), std::string::npos);
    EXPECT_NE(LanguageTable::executable_names().find("rust"), std::string::npos);
}
