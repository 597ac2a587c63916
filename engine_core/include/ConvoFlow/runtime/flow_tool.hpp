#pragma once

/**
 * @file flow_tool.hpp
 * @brief Flow Tool - Command-line driver for flow certification
 *
 * Commands:
 * - validate: structural report plus enumerated paths as JSON
 * - paths:    enumerated paths as JSON
 * - export:   canonical YAML text, or {"yaml", "filename"} with --json
 *
 * Exit codes follow ToolExitCode.
 */

#include "ConvoFlow/core/result.hpp"
#include "ConvoFlow/core/types.hpp"
#include "ConvoFlow/flow/flow_model.hpp"
#include "ConvoFlow/io/flow_json.hpp"
#include "ConvoFlow/runtime/config_manager.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace ConvoFlow::runtime {

enum class ToolCommand { None, Validate, Paths, Export };

namespace ToolExitCode {
inline constexpr i32 Success = 0;
inline constexpr i32 InvalidFlow = 1;
inline constexpr i32 InputError = 2;
inline constexpr i32 OutputError = 3;
} // namespace ToolExitCode

/**
 * @brief Command-line options
 */
struct ToolOptions {
  ToolCommand command = ToolCommand::None;
  std::string flowPath;
  std::string configPath;  // Explicit config file
  std::string backend;     // Serializer backend override
  std::string logFile;     // Log file override
  std::string outputPath;  // export: write here instead of stdout
  bool json = false;       // export: JSON response instead of raw YAML
  bool verbose = false;    // Debug logging
  bool help = false;       // Show help
  bool version = false;    // Show version
  std::vector<std::string> errors; // Problems found while parsing arguments
};

class FlowTool {
public:
  FlowTool();
  ~FlowTool();

  // Non-copyable
  FlowTool(const FlowTool&) = delete;
  FlowTool& operator=(const FlowTool&) = delete;

  /**
   * @brief Parse arguments, load configuration and set up logging
   * @return Success or error; --help and --version succeed without loading
   */
  Result<void> initialize(int argc, char* argv[]);

  /**
   * @brief Initialize with explicit options (for embedding and tests)
   * @param workingDirectory Where to look for the default config file
   */
  Result<void> initialize(const ToolOptions& options, const std::string& workingDirectory = ".");

  /**
   * @brief Execute the selected command
   * @return Process exit code
   */
  i32 run();

  /**
   * @brief Redirect report and diagnostic output (defaults: stdout, stderr)
   */
  void setOutputStreams(std::ostream& out, std::ostream& err);

  [[nodiscard]] const ToolOptions& getOptions() const { return m_options; }
  [[nodiscard]] const ToolConfig& getConfig() const { return m_config.getConfig(); }

  static ToolOptions parseArgs(int argc, char* argv[]);
  static void printHelp(std::ostream& out, const char* programName);
  static void printVersion(std::ostream& out);

private:
  Result<void> initializeConfig(const std::string& workingDirectory);
  Result<void> initializeLogging();

  i32 runValidate();
  i32 runPaths();
  i32 runExport();

  /**
   * @brief Read the flow file; on failure report the reader's errors
   *        in the command's response shape and return false
   */
  bool loadFlow(flow::Flow& flow);

  /**
   * @brief Log an error and print it to the diagnostic stream
   */
  void showError(const std::string& message);

  Result<void> writeOutput(const std::string& text);
  [[nodiscard]] std::string dumpJson(const io::Json& json) const;

  std::string m_programName = "convoflow";
  ToolOptions m_options;
  ConfigManager m_config;
  std::ostream* m_out;
  std::ostream* m_err;
  bool m_initialized = false;
};

} // namespace ConvoFlow::runtime
