/**
 * @file convoflow_main.cpp
 * @brief convoflow - Command-line entry point
 *
 * Usage:
 *   convoflow validate flow.json            # Structural report and paths
 *   convoflow paths flow.json               # Conversation paths only
 *   convoflow export flow.json -o flow.yaml # Canonical YAML
 *   convoflow --help                        # Show help
 */

#include "ConvoFlow/runtime/flow_tool.hpp"
#include <iostream>

namespace {

int runFlowTool(int argc, char* argv[]) {
  ConvoFlow::runtime::FlowTool tool;

  auto result = tool.initialize(argc, argv);
  if (result.isError()) {
    std::cerr << "Error: " << result.error() << "\n";
    std::cerr << "Run '" << (argc > 0 ? argv[0] : "convoflow") << " --help' for usage.\n";
    return ConvoFlow::runtime::ToolExitCode::InputError;
  }

  return tool.run();
}

} // namespace

int main(int argc, char* argv[]) {
  return runFlowTool(argc, argv);
}
