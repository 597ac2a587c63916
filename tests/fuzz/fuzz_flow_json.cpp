// Fuzz testing for the ConvoFlow flow reader using libFuzzer
// Arbitrary bytes go through JSON reading, validation, path enumeration and
// canonical export. Schema errors are expected; exceptions and crashes are not.

#include "ConvoFlow/flow/canonical_serializer.hpp"
#include "ConvoFlow/flow/path_enumerator.hpp"
#include "ConvoFlow/flow/structural_validator.hpp"
#include "ConvoFlow/io/flow_json.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace ConvoFlow;

// libFuzzer entry point
// See: https://llvm.org/docs/LibFuzzer.html
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* Data, size_t Size) {
  std::string input(reinterpret_cast<const char*>(Data), Size);

  io::FlowJsonReader reader;
  auto result = reader.readString(input);
  if (result.isError()) {
    (void)reader.errors().size();
    return 0;
  }

  const flow::Flow& parsed = result.value();
  const flow::GraphIndex index(parsed);

  auto report = flow::StructuralValidator().validate(parsed, index);
  (void)report.valid;

  // Keep the search bounded on adversarial graphs
  auto paths = flow::PathEnumerator(index, 64).enumerate();
  (void)paths.size();

  auto yaml = flow::serialize(parsed);
  (void)yaml.size();

  return 0;
}
