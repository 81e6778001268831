// tests/cli/test_cli.cpp
#define BOOST_TEST_MODULE CliTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "cmdschema/cli/root_command.hpp"
#include "cmdschema/commands/command_support.hpp"

namespace fs = boost::filesystem;

using cmdschema::cli::RootCommand;
using nlohmann::json;

namespace {

// Redirects std::cout into a buffer for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

}  // namespace

struct CliFixture {
    const fs::path root =
        fs::temp_directory_path() / fs::unique_path("cmdschema_cli_%%%%");

    CliFixture() {
        fs::create_directories(root);
        write("agents/flutter-builder.md", "---\nname: flutter-builder\n---\n");
        write("commands/build.yaml", R"(
name: build
agents: [flutter-builder]
options:
  - name: platform
    type: choice
    required: true
    choices: [ios, android]
)");
        write("commands/test.yaml", R"(
name: test
options:
  - name: coverage
    type: boolean
    default: false
)");
    }

    ~CliFixture() { fs::remove_all(root); }

    void write(const std::string& relative, const std::string& content) {
        fs::path file_path = root / relative;
        fs::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path.string());
        ofs << content;
    }

    // Runs the root command and parses its JSON report, if any
    int run(std::vector<std::string> args, json& output) {
        args.insert(args.begin(), "cmdschema");
        CoutCapture capture;
        int code = RootCommand::create()->execute(args);
        const std::string text = capture.str();
        // Usage errors print plain text
        output = text.rfind("{", 0) == 0 ? json::parse(text) : json();
        return code;
    }
};

BOOST_FIXTURE_TEST_SUITE(CliTestSuite, CliFixture)

BOOST_AUTO_TEST_CASE(test_validate_ok) {
    json out;
    int code = run({"validate", "--root", root.string()}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_CHECK(out["ok"].get<bool>());
    BOOST_CHECK(out["commands"] == json({"build", "test"}));
}

BOOST_AUTO_TEST_CASE(test_validate_dangling_agent) {
    write("commands/add-backend.yaml",
          "name: add-backend\nagents: [flutter-firebase-core]\n");
    json out;
    int code = run({"validate", "-r", root.string()}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_LOAD_ERROR);
    BOOST_CHECK(!out["ok"].get<bool>());
    BOOST_REQUIRE_EQUAL(out["dangling_agent_references"].size(), 1u);
    BOOST_CHECK_EQUAL(
        out["dangling_agent_references"][0]["agent"].get<std::string>(),
        "flutter-firebase-core");
}

BOOST_AUTO_TEST_CASE(test_list_named_command) {
    json out;
    int code = run({"list", "--root", root.string(), "build"}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_REQUIRE_EQUAL(out["commands"].size(), 1u);
    BOOST_CHECK_EQUAL(out["commands"][0]["name"].get<std::string>(), "build");
    BOOST_CHECK(out["commands"][0]["arguments"][0]["choices"] ==
                json({"ios", "android"}));
}

BOOST_AUTO_TEST_CASE(test_list_unknown_command) {
    json out;
    int code = run({"list", "--root", root.string(), "deploy"}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_INVOCATION_ERROR);
    BOOST_CHECK_EQUAL(out["error"]["code"].get<std::string>(),
                      "UnknownCommand");
}

BOOST_AUTO_TEST_CASE(test_resolve_success) {
    json out;
    int code = run({"resolve", "--root", root.string(), "--", "build",
                    "--platform", "ios"},
                   out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_CHECK(out["ok"].get<bool>());
    BOOST_CHECK_EQUAL(
        out["invocation"]["values"]["platform"].get<std::string>(), "ios");
}

BOOST_AUTO_TEST_CASE(test_resolve_default) {
    json out;
    int code = run({"resolve", "--root", root.string(), "--", "test"}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_CHECK(out["invocation"]["values"]["coverage"] == json(false));
    BOOST_CHECK(out["invocation"]["provided"].empty());
}

BOOST_AUTO_TEST_CASE(test_resolve_invalid_choice) {
    json out;
    int code = run({"resolve", "--root", root.string(), "--", "build",
                    "--platform", "windows"},
                   out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_INVOCATION_ERROR);
    BOOST_CHECK_EQUAL(out["error"]["code"].get<std::string>(),
                      "InvalidChoice");
    BOOST_CHECK(out["error"]["allowed"] == json({"ios", "android"}));
}

BOOST_AUTO_TEST_CASE(test_resolve_without_command) {
    json out;
    int code = run({"resolve", "--root", root.string()}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_USAGE_ERROR);
}

BOOST_AUTO_TEST_CASE(test_unknown_flag_is_usage_error) {
    CoutCapture capture;
    int code = RootCommand::create()->execute(
        std::vector<std::string>{"cmdschema", "validate", "--bogus"});
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_USAGE_ERROR);
}

BOOST_AUTO_TEST_CASE(test_missing_config_file) {
    json out;
    int code = run({"validate", "--config", (root / "absent.yaml").string()},
                   out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_USAGE_ERROR);
}

BOOST_AUTO_TEST_CASE(test_config_file_root) {
    write("cmdschema.yaml", "catalog:\n  root: " + root.string() + "\n");
    json out;
    int code = run(
        {"validate", "--config", (root / "cmdschema.yaml").string()}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_CHECK_EQUAL(out["commands"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(test_config_file_extra_agents) {
    write("commands/deploy.yaml", "name: deploy\nagents: [host-agent]\n");
    write("cmdschema.yaml", "catalog:\n  root: " + root.string() +
                                "\n  extra_agents: [host-agent]\n");
    json out;
    int code = run(
        {"validate", "--config", (root / "cmdschema.yaml").string()}, out);
    BOOST_CHECK_EQUAL(code, cmdschema::commands::EXIT_OK);
    BOOST_CHECK_EQUAL(out["commands"].size(), 3u);
}

BOOST_AUTO_TEST_CASE(test_version) {
    CoutCapture capture;
    int code = RootCommand::create()->execute(
        std::vector<std::string>{"cmdschema", "--version"});
    BOOST_CHECK_EQUAL(code, 0);
    BOOST_CHECK(capture.str().find("cmdschema ") == 0);
}

BOOST_AUTO_TEST_SUITE_END()
