#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "signage_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(store:
  local:
    root_path: "C:\\signage\\\"quoted\"\\store"
)");

  auto config = signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().local().root_path() == "C:\\signage\\\"quoted\"\\store");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(logging:
  level: "debug"
  pattern: "%v"
store:
  local:
    root_path: "2024"
)");

  auto config = signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.store().local().root_path() == "2024");
}

void TestMemoryStoreIsSelectable() {
  const auto yaml_path = WriteYaml("memory",
                                   R"(store:
  memory: {}
)");

  auto config = signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().has_memory());
}

void TestMissingStoreFallsBackToDefaultRoot() {
  const auto yaml_path = WriteYaml("logging_only",
                                   R"(logging:
  level: warn
)");

  auto config = signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().has_local());
  assert(config.store().local().root_path() == signage::config::ConfigLoader::kDefaultStoreRoot);

  auto empty = signage::config::ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  assert(empty.store().local().root_path() == signage::config::ConfigLoader::kDefaultStoreRoot);

  auto defaults = signage::config::ConfigLoader::Defaults();
  assert(defaults.store().local().root_path() == signage::config::ConfigLoader::kDefaultStoreRoot);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(store:
  local:
    root_path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptyRootPathIsRejected() {
  const auto yaml_path = WriteYaml("empty_root",
                                   R"(store:
  local:
    root_path: ""
)");

  bool threw = false;
  try {
    (void)signage::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestNonMappingDocumentIsRejected() {
  bool threw = false;
  try {
    (void)signage::config::ConfigLoader::LoadFromYaml(WriteYaml("sequence", "- a\n- b\n").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestMemoryStoreIsSelectable();
  TestMissingStoreFallsBackToDefaultRoot();
  TestUnknownFieldsAreRejected();
  TestEmptyRootPathIsRejected();
  TestNonMappingDocumentIsRejected();

  std::cout << "signage_unit_config_loader: pass\n";
  return 0;
}
