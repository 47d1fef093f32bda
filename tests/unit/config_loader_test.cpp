#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using lieko::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "liekodb_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
storage:
  disk:
    root_path: "/var/lib/liekodb"
    fsync: true
database:
  sqlite:
    path: "/var/lib/liekodb/meta.db"
locks:
  write_timeout_ms: 250
logging:
  level: debug
auth:
  admin_key: "s3cret"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.storage().has_disk());
  assert(config.storage().disk().root_path() == "/var/lib/liekodb");
  assert(config.storage().disk().fsync());
  assert(config.database().sqlite().path() == "/var/lib/liekodb/meta.db");
  assert(config.locks().write_timeout_ms() == 250);
  assert(config.logging().level() == "debug");
  assert(config.auth().admin_key() == "s3cret");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\lieko\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\lieko\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(auth:
  admin_key: "12345"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.auth().admin_key() == "12345");
}

void TestDefaultsFillEmptyDocument() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.storage().has_disk());
  assert(!config.storage().disk().root_path().empty());
  assert(config.database().has_memory());
  assert(config.locks().write_timeout_ms() == 30000);
}

void TestExplicitRamStorageIsKept() {
  const auto yaml_path = WriteYaml("ram",
                                   R"(storage:
  ram: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().has_ram());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
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

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/liekodb.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  // the environment overrides auth.admin_key; keep it out of these cases
  unsetenv("LIEKO_ADMIN_KEY");

  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsFillEmptyDocument();
  TestExplicitRamStorageIsKept();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "lieko_unit_config_loader: pass\n";
  return 0;
}
