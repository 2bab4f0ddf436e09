#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using hashtax::config::ConfigLoader;
using hashtax::runtime::config::COMPRESSION_AUTO;
using hashtax::runtime::config::COMPRESSION_ZSTD;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "hashtax_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
input:
  default_ksize: 31
  default_scaled: 1000
output:
  compression: COMPRESSION_ZSTD
  names_only: true
taxonomy:
  path: "/data/gtdb-rs214.lineages.csv"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.input().default_ksize() == 31);
  assert(config.input().default_scaled() == 1000);
  assert(config.output().compression() == COMPRESSION_ZSTD);
  assert(config.output().names_only());
  assert(config.taxonomy().path() == "/data/gtdb-rs214.lineages.csv");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(taxonomy:
  path: "C:\\taxonomy\\\"quoted\"\\lineages.csv"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.taxonomy().path() == "C:\\taxonomy\\\"quoted\"\\lineages.csv");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(taxonomy:
  path: "2024"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.taxonomy().path() == "2024");
}

void TestEmptyDocumentKeepsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level().empty());
  assert(config.input().default_ksize() == 0);
  assert(config.output().compression() == COMPRESSION_AUTO);
  assert(!config.output().names_only());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: info
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnknownLogLevelIsRejected() {
  const auto yaml_path = WriteYaml("bad_level",
                                   R"(logging:
  level: loud
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const hashtax::util::InvalidArgument&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown log levels.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "hashtax_missing_config.yaml").string());
  } catch (const hashtax::util::FileNotFound&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentKeepsDefaults();
  TestUnknownFieldsAreRejected();
  TestUnknownLogLevelIsRejected();
  TestMissingFileIsReported();

  std::cout << "hashtax_unit_config_loader: pass\n";
  return 0;
}
