#include "cli/App.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace funcscan;
using json = nlohmann::json;
namespace fs = std::filesystem;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Determine fixtures path
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fixtures_dir = test_dir / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir)) << "Fixtures directory not found";
    }

    int Run(std::vector<std::string> args) {
        out.str("");
        err.str("");
        args.insert(args.begin(), "funcscan");

        std::vector<const char*> argv;
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        return run_cli(static_cast<int>(argv.size()), argv.data(), out, err);
    }

    std::string Fixture(const std::string& name) const {
        return (fixtures_dir / name).string();
    }

    std::ostringstream out;
    std::ostringstream err;
    fs::path fixtures_dir;
};

TEST_F(EndToEndTest, ExtractsFixture) {
    int code = Run({Fixture("simple_module.py")});

    EXPECT_EQ(code, 0);
    json result = json::parse(out.str());
    ASSERT_TRUE(result.is_array());
    ASSERT_EQ(result.size(), 5u);

    const json& first = result[0];
    EXPECT_EQ(first["name"], "greet");
    EXPECT_EQ(first["signature"], "def greet(name):");
    EXPECT_EQ(first["start_line"], 6);
    EXPECT_EQ(first["end_line"], 7);
    EXPECT_EQ(first["module"], "simple_module");
    EXPECT_EQ(first["imports"].size(), 5u);

    for (const auto& record : result) {
        EXPECT_EQ(record.size(), 7u);
        EXPECT_EQ(record["imports"], first["imports"]);
        EXPECT_EQ(record["module"], first["module"]);
    }
}

TEST_F(EndToEndTest, NoFunctionsGivesEmptyArray) {
    int code = Run({Fixture("no_functions.py")});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out.str(), "[]\n");
}

TEST_F(EndToEndTest, ParseFailure) {
    int code = Run({Fixture("invalid_syntax.py")});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    json error = json::parse(err.str());
    ASSERT_TRUE(error.contains("error"));
    EXPECT_NE(error["error"].get<std::string>().find("invalid syntax"), std::string::npos);
}

TEST_F(EndToEndTest, MissingFileIsStructuredError) {
    int code = Run({Fixture("does_not_exist.py")});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    json error = json::parse(err.str());
    EXPECT_TRUE(error.contains("error"));
}

TEST_F(EndToEndTest, NoArgumentsIsUsageError) {
    int code = Run({});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(EndToEndTest, TwoArgumentsIsUsageError) {
    int code = Run({Fixture("simple_module.py"), Fixture("no_functions.py")});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(EndToEndTest, LinesFilter) {
    int code = Run({"--lines", "11", "--lines", "30-33", Fixture("simple_module.py")});

    EXPECT_EQ(code, 0);
    json result = json::parse(out.str());
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0]["name"], "fetch");
    EXPECT_EQ(result[1]["name"], "uses_local_import");
}

TEST_F(EndToEndTest, InvalidLinesIsUsageError) {
    int code = Run({"--lines", "9-2", Fixture("simple_module.py")});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(EndToEndTest, InvalidLogLevelIsUsageError) {
    int code = Run({"--log-level", "loud", Fixture("simple_module.py")});

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(EndToEndTest, CompactOutput) {
    int code = Run({"--compact", Fixture("simple_module.py")});

    EXPECT_EQ(code, 0);
    std::string text = out.str();
    EXPECT_EQ(text.find('\n'), text.size() - 1);
    EXPECT_EQ(json::parse(text).size(), 5u);
}

TEST_F(EndToEndTest, Version) {
    int code = Run({"--version"});

    EXPECT_EQ(code, 0);
    EXPECT_NE(out.str().find(kVersion), std::string::npos);
}
