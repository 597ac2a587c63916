/**
 * @file test_flow_tool.cpp
 * @brief Unit tests for the convoflow command-line driver
 */

#include "ConvoFlow/runtime/flow_tool.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace ConvoFlow;
using namespace ConvoFlow::runtime;

namespace {

const char* const kValidFlow = R"({
  "id": "sample-flow", "name": "Sample flow",
  "nodes": [
    {"id": "start", "type": "question", "data": {"question": "Where to?", "expectedAnswers": ["yes", "no"]}},
    {"id": "end", "type": "message", "data": {"message": "Completed"}}
  ],
  "edges": [
    {"source": "start", "target": "end", "viaLabel": "yes"}
  ]
})";

const char* const kCyclicFlow = R"({
  "id": "loop", "name": "Loop",
  "nodes": [
    {"id": "start", "type": "question", "data": {"expectedAnswers": ["yes", "no"]}},
    {"id": "loop", "type": "action"},
    {"id": "end", "type": "message"}
  ],
  "edges": [
    {"source": "start", "target": "loop", "viaLabel": "yes"},
    {"source": "loop", "target": "start"},
    {"source": "start", "target": "end", "viaLabel": "no"}
  ]
})";

// Temporary working directory with flow and config files
class ToolWorkspace {
public:
  ToolWorkspace() {
    m_path = fs::temp_directory_path() /
             ("convoflow_test_tool_" +
              std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(m_path);
  }

  ~ToolWorkspace() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  std::string path() const { return m_path.string(); }

  std::string file(const std::string& name) const { return (m_path / name).string(); }

  std::string write(const std::string& name, const std::string& content) {
    std::ofstream out(m_path / name);
    out << content;
    return file(name);
  }

  std::string read(const std::string& name) const {
    std::ifstream in(m_path / name);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }

private:
  fs::path m_path;
};

struct ToolRun {
  Result<void> init = Result<void>::ok();
  i32 exitCode = -1;
  std::string out;
  std::string err;
};

ToolRun runTool(const ToolOptions& options, const std::string& workingDirectory) {
  FlowTool tool;
  std::ostringstream out;
  std::ostringstream err;
  tool.setOutputStreams(out, err);

  ToolRun run;
  run.init = tool.initialize(options, workingDirectory);
  if (run.init.isOk()) {
    run.exitCode = tool.run();
  }
  run.out = out.str();
  run.err = err.str();
  return run;
}

ToolOptions parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return FlowTool::parseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

// ===========================================================================
// Argument parsing
// ===========================================================================

TEST_CASE("FlowTool - Parses commands and options", "[flow_tool]") {
  ToolOptions options = parse({"convoflow", "export", "flow.json", "--backend", "yaml-cpp",
                               "--json", "-o", "out.json", "--config", "cfg.json", "--log-file",
                               "run.log", "--verbose"});

  CHECK(options.errors.empty());
  CHECK(options.command == ToolCommand::Export);
  CHECK(options.flowPath == "flow.json");
  CHECK(options.backend == "yaml-cpp");
  CHECK(options.json);
  CHECK(options.outputPath == "out.json");
  CHECK(options.configPath == "cfg.json");
  CHECK(options.logFile == "run.log");
  CHECK(options.verbose);
}

TEST_CASE("FlowTool - Reports argument problems", "[flow_tool]") {
  SECTION("Unknown command") {
    ToolOptions options = parse({"convoflow", "run", "flow.json"});
    CHECK(options.errors == std::vector<std::string>{"Unknown command: run"});
  }

  SECTION("Unknown option") {
    ToolOptions options = parse({"convoflow", "validate", "flow.json", "--fast"});
    CHECK(options.errors == std::vector<std::string>{"Unknown option: --fast"});
  }

  SECTION("Option without its value") {
    ToolOptions options = parse({"convoflow", "validate", "flow.json", "--config"});
    CHECK(options.errors == std::vector<std::string>{"Option --config requires a value"});
  }

  SECTION("Extra positional arguments") {
    ToolOptions options = parse({"convoflow", "paths", "a.json", "b.json"});
    CHECK(options.errors == std::vector<std::string>{"Unexpected argument: b.json"});
  }

  SECTION("Initialization fails with the first problem") {
    FlowTool tool;
    ToolOptions options = parse({"convoflow", "validate"});
    auto result = tool.initialize(options);
    REQUIRE(result.isError());
    CHECK(result.error() == "No flow file given");
  }
}

TEST_CASE("FlowTool - Help and version", "[flow_tool]") {
  ToolWorkspace workspace;

  ToolOptions help;
  help.help = true;
  auto run = runTool(help, workspace.path());
  CHECK(run.exitCode == ToolExitCode::Success);
  CHECK(run.out.find("Usage:") != std::string::npos);
  CHECK(run.out.find("validate") != std::string::npos);

  ToolOptions version;
  version.version = true;
  run = runTool(version, workspace.path());
  CHECK(run.exitCode == ToolExitCode::Success);
  CHECK(run.out.rfind("convoflow version ", 0) == 0);
}

// ===========================================================================
// Commands
// ===========================================================================

TEST_CASE("FlowTool - validate", "[flow_tool]") {
  ToolWorkspace workspace;
  ToolOptions options;
  options.command = ToolCommand::Validate;

  SECTION("Valid flow exits with success") {
    options.flowPath = workspace.write("flow.json", kValidFlow);
    workspace.write("convoflow.json", R"({"output": {"jsonIndent": -1}})");

    auto run = runTool(options, workspace.path());

    REQUIRE(run.init.isOk());
    CHECK(run.exitCode == ToolExitCode::Success);
    CHECK(run.err.empty());
    CHECK(run.out == R"({"valid":true,"errors":[],"warnings":[],)"
                     R"("paths":[[{"nodeId":"start"},{"nodeId":"end","via":"yes"}]]})"
                     "\n");
  }

  SECTION("Structurally invalid flow exits with 1") {
    options.flowPath = workspace.write("flow.json", kCyclicFlow);

    auto run = runTool(options, workspace.path());

    CHECK(run.exitCode == ToolExitCode::InvalidFlow);
    CHECK(run.out.find("\"valid\": false") != std::string::npos);
    CHECK(run.out.find("Cycle detected: start -> loop -> start") != std::string::npos);
  }

  SECTION("Schema errors produce an invalid report and exit with 2") {
    options.flowPath = workspace.write("flow.json", R"({"id": "f", "nodes": []})");
    workspace.write("convoflow.json", R"({"output": {"jsonIndent": -1}})");

    auto run = runTool(options, workspace.path());

    CHECK(run.exitCode == ToolExitCode::InputError);
    CHECK(run.out == R"({"valid":false,"errors":["name: Field required"],"warnings":[],"paths":[]})"
                     "\n");
  }

  SECTION("Missing flow file exits with 2") {
    options.flowPath = workspace.file("absent.json");

    auto run = runTool(options, workspace.path());

    CHECK(run.exitCode == ToolExitCode::InputError);
    CHECK(run.out.find("Cannot open flow file") != std::string::npos);
    CHECK(run.err.rfind("Error: Rejected flow file ", 0) == 0);
  }
}

TEST_CASE("FlowTool - paths", "[flow_tool]") {
  ToolWorkspace workspace;
  workspace.write("convoflow.json", R"({"output": {"jsonIndent": -1}})");

  ToolOptions options;
  options.command = ToolCommand::Paths;
  options.flowPath = workspace.write("flow.json", kValidFlow);

  auto run = runTool(options, workspace.path());

  CHECK(run.exitCode == ToolExitCode::Success);
  CHECK(run.out == "[[{\"nodeId\":\"start\"},{\"nodeId\":\"end\",\"via\":\"yes\"}]]\n");
}

TEST_CASE("FlowTool - export", "[flow_tool]") {
  ToolWorkspace workspace;
  ToolOptions options;
  options.command = ToolCommand::Export;
  options.flowPath = workspace.write("flow.json", kValidFlow);

  const std::string expectedYaml = "id: sample-flow\n"
                                   "name: Sample flow\n"
                                   "flow:\n"
                                   "  start:\n"
                                   "    type: question\n"
                                   "    question: Where to?\n"
                                   "    expected_answers:\n"
                                   "      - yes\n"
                                   "      - no\n"
                                   "    next:\n"
                                   "      yes: end\n"
                                   "  end:\n"
                                   "    type: message\n"
                                   "    message: Completed\n";

  SECTION("YAML to stdout") {
    auto run = runTool(options, workspace.path());
    CHECK(run.exitCode == ToolExitCode::Success);
    CHECK(run.out == expectedYaml);
  }

  SECTION("JSON response") {
    options.json = true;
    auto run = runTool(options, workspace.path());
    CHECK(run.exitCode == ToolExitCode::Success);
    CHECK(run.out.find("\"filename\": \"sample-flow.yaml\"") != std::string::npos);
  }

  SECTION("Written to a file") {
    options.outputPath = workspace.file("sample.yaml");
    auto run = runTool(options, workspace.path());
    CHECK(run.exitCode == ToolExitCode::Success);
    CHECK(run.out.empty());
    CHECK(workspace.read("sample.yaml") == expectedYaml);
  }

  SECTION("Unwritable output exits with 3") {
    options.outputPath = workspace.file("missing-dir/sample.yaml");
    auto run = runTool(options, workspace.path());
    CHECK(run.exitCode == ToolExitCode::OutputError);
    CHECK(run.err.find("Error: Cannot open output file: ") != std::string::npos);
  }

  SECTION("Backend override from the command line") {
    workspace.write("convoflow.json", R"({"serializer": {"backend": "plain"}})");
    options.backend = "yaml-cpp";
    FlowTool tool;
    std::ostringstream out;
    std::ostringstream err;
    tool.setOutputStreams(out, err);
    REQUIRE(tool.initialize(options, workspace.path()).isOk());
    CHECK(tool.getConfig().serializer.backend == flow::SerializerKind::YamlCpp);
    CHECK(tool.run() == ToolExitCode::Success);
    CHECK(out.str().find("sample-flow") != std::string::npos);
  }

  SECTION("Unknown backend is a configuration error") {
    options.backend = "xml";
    FlowTool tool;
    auto result = tool.initialize(options, workspace.path());
    REQUIRE(result.isError());
    CHECK(result.error() == "Unknown serializer backend: xml");
  }
}

TEST_CASE("FlowTool - Explicit config file must exist", "[flow_tool]") {
  ToolWorkspace workspace;
  ToolOptions options;
  options.command = ToolCommand::Validate;
  options.flowPath = workspace.write("flow.json", kValidFlow);
  options.configPath = workspace.file("absent.json");

  FlowTool tool;
  auto result = tool.initialize(options, workspace.path());

  REQUIRE(result.isError());
  CHECK(result.error().find("Cannot open config file") != std::string::npos);

  std::ostringstream out;
  std::ostringstream err;
  tool.setOutputStreams(out, err);
  CHECK(tool.run() == ToolExitCode::InputError);
  CHECK(out.str().empty());
  CHECK(err.str().find("before a successful initialize") != std::string::npos);
}
