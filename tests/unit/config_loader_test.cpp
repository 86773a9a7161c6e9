#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using settlement::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "settlement_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "C:\\settlement\\\"quoted\"\\db.sqlite"
    wal_mode: true
coordinator:
  request_timeout: "3600s"
bidding:
  min_duration_hours: 2
  max_duration_hours: 48
  min_escrow: 10
verification:
  rate_denominator: 10000
  tolerance_numerator: 90
  tolerance_denominator: 100
oracle:
  local:
    enabled: true
    signing_seed: "2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a2a"
    auto_deliver: true
    delivery_delay_ms: 250
registry:
  operator_account: "operator"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "C:\\settlement\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.coordinator().request_timeout().seconds() == 3600);
  assert(config.bidding().min_duration_hours() == 2);
  assert(config.bidding().max_duration_hours() == 48);
  assert(config.bidding().min_escrow() == 10);
  assert(config.verification().tolerance_numerator() == 90);
  assert(config.oracle().local().enabled());
  assert(config.oracle().local().signing_seed().size() == 64);
  assert(config.oracle().local().delivery_delay_ms() == 250);
  assert(config.registry().operator_account() == "operator");
}

void TestDefaultsFillUnsetSections() {
  auto config = ConfigLoader::LoadFromYamlString("registry:\n  operator_account: ops\n");
  assert(config.server().bind_address() == settlement::config::kDefaultBindAddress);
  assert(config.database().has_memory());
  assert(config.coordinator().request_timeout().seconds() == 7 * 24 * 60 * 60);
  assert(config.bidding().min_duration_hours() == 1);
  assert(config.bidding().max_duration_hours() == 168);
  assert(config.verification().rate_denominator() == 10000);
  assert(config.verification().tolerance_numerator() == 95);
  assert(config.verification().tolerance_denominator() == 100);

  auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.database().has_memory());
  assert(empty.registry().operator_account().empty());
}

void TestQuotedDigitsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(oracle:
  attestation_public_key: "1234567890123456789012345678901234567890123456789012345678901234"
server:
  bind_address: "line1\nline2☃"
)");
  assert(config.oracle().attestation_public_key() == "1234567890123456789012345678901234567890123456789012345678901234");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestLargeIntegersKeepPrecision() {
  auto config = ConfigLoader::LoadFromYamlString("bidding:\n  min_escrow: 18446744073709551615\n");
  assert(config.bidding().min_escrow() == 18446744073709551615ull);
}

template <typename Fn>
void ExpectRejected(Fn&& fn, const char* what) {
  bool threw = false;
  try {
    fn();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && what);
}

void TestInvalidDocumentsAreRejected() {
  ExpectRejected([] { (void)ConfigLoader::LoadFromYamlString("unknown_field: 123\n"); }, "unknown top-level field");
  ExpectRejected([] { (void)ConfigLoader::LoadFromYamlString("bidding:\n  min_escrw: 1\n"); }, "misspelled field");
  ExpectRejected([] { (void)ConfigLoader::LoadFromYamlString("bidding:\n  min_escrow: lots\n"); }, "mistyped value");
  ExpectRejected([] { (void)ConfigLoader::LoadFromYamlString("- a\n- b\n"); }, "top level sequence");
  ExpectRejected([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/settlement.yaml"); }, "missing file");
}

} // namespace

int main() {
  TestFullDocument();
  TestDefaultsFillUnsetSections();
  TestQuotedDigitsStayStrings();
  TestLargeIntegersKeepPrecision();
  TestInvalidDocumentsAreRejected();

  std::cout << "settlement_unit_config_loader: pass\n";
  return 0;
}
