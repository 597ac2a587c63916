/**
 * @file flow_tool.cpp
 * @brief Flow Tool implementation
 */

#include "ConvoFlow/runtime/flow_tool.hpp"
#include "ConvoFlow/core/logger.hpp"
#include "ConvoFlow/core/version.hpp"
#include "ConvoFlow/flow/canonical_serializer.hpp"
#include "ConvoFlow/flow/path_enumerator.hpp"
#include "ConvoFlow/flow/structural_validator.hpp"
#include <fstream>
#include <iostream>

namespace ConvoFlow::runtime {

namespace {

bool parseCommand(const std::string& name, ToolCommand& outCommand) {
  if (name == "validate") {
    outCommand = ToolCommand::Validate;
  } else if (name == "paths") {
    outCommand = ToolCommand::Paths;
  } else if (name == "export") {
    outCommand = ToolCommand::Export;
  } else {
    return false;
  }
  return true;
}

} // namespace

FlowTool::FlowTool() : m_out(&std::cout), m_err(&std::cerr) {}

FlowTool::~FlowTool() = default;

Result<void> FlowTool::initialize(int argc, char* argv[]) {
  if (argc > 0 && argv[0] != nullptr) {
    m_programName = argv[0];
  }
  return initialize(parseArgs(argc, argv));
}

Result<void> FlowTool::initialize(const ToolOptions& options,
                                  const std::string& workingDirectory) {
  m_options = options;
  m_initialized = false;

  if (m_options.help || m_options.version) {
    m_initialized = true;
    return Result<void>::ok();
  }

  if (!m_options.errors.empty()) {
    return Result<void>::error(m_options.errors.front());
  }
  if (m_options.command == ToolCommand::None) {
    return Result<void>::error("No command given");
  }
  if (m_options.flowPath.empty()) {
    return Result<void>::error("No flow file given");
  }

  auto result = initializeConfig(workingDirectory);
  if (result.isError()) {
    return result;
  }

  result = initializeLogging();
  if (result.isError()) {
    return result;
  }

  m_initialized = true;
  return Result<void>::ok();
}

i32 FlowTool::run() {
  if (!m_initialized) {
    showError("FlowTool::run called before a successful initialize");
    return ToolExitCode::InputError;
  }

  if (m_options.help) {
    printHelp(*m_out, m_programName.c_str());
    return ToolExitCode::Success;
  }
  if (m_options.version) {
    printVersion(*m_out);
    return ToolExitCode::Success;
  }

  switch (m_options.command) {
  case ToolCommand::Validate:
    return runValidate();
  case ToolCommand::Paths:
    return runPaths();
  case ToolCommand::Export:
    return runExport();
  case ToolCommand::None:
    break;
  }
  return ToolExitCode::InputError;
}

void FlowTool::setOutputStreams(std::ostream& out, std::ostream& err) {
  m_out = &out;
  m_err = &err;
}

void FlowTool::printVersion(std::ostream& out) {
  out << "convoflow version " << CONVOFLOW_VERSION_MAJOR << "." << CONVOFLOW_VERSION_MINOR << "."
      << CONVOFLOW_VERSION_PATCH << "\n";
  out << "Structural validation and canonical export for conversational flows\n";
}

void FlowTool::printHelp(std::ostream& out, const char* programName) {
  out << "Usage: " << programName << " <command> <flow.json> [options]\n\n";
  out << "Commands:\n";
  out << "  validate          Check flow structure and list conversation paths\n";
  out << "  paths             List every path from a start node to a terminal message\n";
  out << "  export            Print the canonical YAML form of the flow\n\n";
  out << "Options:\n";
  out << "  --config <path>   Load configuration from this file\n";
  out << "  --backend <name>  Serializer backend for export (plain, yaml-cpp)\n";
  out << "  --output <path>   export: write to a file instead of stdout\n";
  out << "  --json            export: print {\"yaml\", \"filename\"} as JSON\n";
  out << "  --log-file <path> Also write log messages to this file\n";
  out << "  --verbose         Verbose logging\n";
  out << "  -h, --help        Show this help message\n";
  out << "  --version         Show version information\n\n";
  out << "Without --config, " << ConfigManager::kDefaultConfigFile
      << " in the working directory is loaded when present.\n\n";
  out << "Exit codes: 0 success, 1 flow invalid, 2 input or configuration error,\n";
  out << "            3 output could not be written\n";
}

ToolOptions FlowTool::parseArgs(int argc, char* argv[]) {
  ToolOptions opts;
  std::vector<std::string> positional;

  auto takeValue = [&](int& i, const std::string& name, std::string& out) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      opts.errors.push_back("Option " + name + " requires a value");
    }
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--config") {
      takeValue(i, arg, opts.configPath);
    } else if (arg == "--backend") {
      takeValue(i, arg, opts.backend);
    } else if (arg == "--log-file") {
      takeValue(i, arg, opts.logFile);
    } else if (arg == "--output" || arg == "-o") {
      takeValue(i, arg, opts.outputPath);
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      opts.errors.push_back("Unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (!positional.empty() && !parseCommand(positional[0], opts.command)) {
    opts.errors.push_back("Unknown command: " + positional[0]);
  }
  if (positional.size() > 1) {
    opts.flowPath = positional[1];
  }
  for (usize i = 2; i < positional.size(); ++i) {
    opts.errors.push_back("Unexpected argument: " + positional[i]);
  }

  return opts;
}

Result<void> FlowTool::initializeConfig(const std::string& workingDirectory) {
  m_config.resetToDefaults();

  auto result = m_options.configPath.empty() ? m_config.loadDefaultFile(workingDirectory)
                                             : m_config.loadFromFile(m_options.configPath);
  if (result.isError()) {
    return result;
  }

  // Command-line overrides
  ToolConfig& config = m_config.getConfigMutable();
  if (!m_options.backend.empty() &&
      !flow::parseSerializerKind(m_options.backend, config.serializer.backend)) {
    return Result<void>::error("Unknown serializer backend: " + m_options.backend);
  }
  if (!m_options.logFile.empty()) {
    config.logging.logFile = m_options.logFile;
  }
  if (m_options.verbose) {
    config.logging.level = core::LogLevel::Debug;
  }

  return Result<void>::ok();
}

Result<void> FlowTool::initializeLogging() {
  const LoggingSettings& settings = m_config.getConfig().logging;
  auto& logger = core::Logger::instance();

  logger.setLevel(settings.level);
  logger.setConsoleOutput(settings.logToConsole);

  if (!settings.logFile.empty() && !logger.setOutputFile(settings.logFile)) {
    return Result<void>::error("Cannot open log file: " + settings.logFile);
  }

  CONVOFLOW_LOG_INFO(std::string("Serializer backend: ") +
                     flow::serializerKindToString(m_config.getConfig().serializer.backend));
  return Result<void>::ok();
}

i32 FlowTool::runValidate() {
  flow::Flow flow;
  if (!loadFlow(flow)) {
    return ToolExitCode::InputError;
  }

  const flow::GraphIndex index(flow);
  const flow::ValidationReport report = flow::StructuralValidator().validate(flow, index);
  const auto paths = flow::PathEnumerator(index).enumerate();

  CONVOFLOW_LOG_INFO("Flow '" + flow.id + "': " + std::to_string(report.errors.size()) +
                     " error(s), " + std::to_string(report.warnings.size()) + " warning(s), " +
                     std::to_string(paths.size()) + " path(s)");

  auto written = writeOutput(dumpJson(io::validationResponseToJson(report, paths)));
  if (written.isError()) {
    showError(written.error());
    return ToolExitCode::OutputError;
  }
  return report.valid ? ToolExitCode::Success : ToolExitCode::InvalidFlow;
}

i32 FlowTool::runPaths() {
  flow::Flow flow;
  if (!loadFlow(flow)) {
    return ToolExitCode::InputError;
  }

  const auto paths = flow::enumeratePaths(flow);
  CONVOFLOW_LOG_INFO("Flow '" + flow.id + "': " + std::to_string(paths.size()) + " path(s)");

  auto written = writeOutput(dumpJson(io::pathsToJson(paths)));
  if (written.isError()) {
    showError(written.error());
    return ToolExitCode::OutputError;
  }
  return ToolExitCode::Success;
}

i32 FlowTool::runExport() {
  flow::Flow flow;
  if (!loadFlow(flow)) {
    return ToolExitCode::InputError;
  }

  std::string yaml;
  try {
    yaml = flow::CanonicalSerializer(m_config.getConfig().serializer.backend).serialize(flow);
  } catch (const std::exception& e) {
    showError(std::string("Export failed: ") + e.what());
    return ToolExitCode::OutputError;
  }

  const std::string text =
      m_options.json ? dumpJson(io::exportResponseToJson(flow, yaml)) : yaml;

  auto written = writeOutput(text);
  if (written.isError()) {
    showError(written.error());
    return ToolExitCode::OutputError;
  }
  if (!m_options.outputPath.empty()) {
    CONVOFLOW_LOG_INFO("Exported flow '" + flow.id + "' to " + m_options.outputPath);
  }
  return ToolExitCode::Success;
}

bool FlowTool::loadFlow(flow::Flow& flow) {
  io::FlowJsonReader reader;
  auto result = reader.loadFromFile(m_options.flowPath);
  if (result.isOk()) {
    flow = std::move(result).value();
    return true;
  }

  showError("Rejected flow file " + m_options.flowPath + ": " + result.error());

  io::Json response;
  if (m_options.command == ToolCommand::Validate) {
    response = io::schemaErrorResponseToJson(reader.errors());
  } else {
    response = io::Json::object();
    response["errors"] = reader.errors();
  }
  *m_out << dumpJson(response);
  return false;
}

void FlowTool::showError(const std::string& message) {
  CONVOFLOW_LOG_ERROR(message);
  *m_err << "Error: " << message << "\n";
}

Result<void> FlowTool::writeOutput(const std::string& text) {
  if (m_options.outputPath.empty()) {
    *m_out << text;
    m_out->flush();
    if (!m_out->good()) {
      return Result<void>::error("Failed to write to standard output");
    }
    return Result<void>::ok();
  }

  std::ofstream file(m_options.outputPath, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Result<void>::error("Cannot open output file: " + m_options.outputPath);
  }
  file << text;
  if (!file.good()) {
    return Result<void>::error("Failed to write output file: " + m_options.outputPath);
  }
  return Result<void>::ok();
}

std::string FlowTool::dumpJson(const io::Json& json) const {
  return json.dump(m_config.getConfig().output.jsonIndent, ' ', false,
                   io::Json::error_handler_t::replace) +
         "\n";
}

} // namespace ConvoFlow::runtime
