#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using shipyard::config::ConfigLoader;
using shipyard::util::ConfigurationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "shipyard_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrowsConfigurationError(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(gateway:
  url: "http://10.0.0.5:8080/"
  token: "secret"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.gateway().url() == "http://10.0.0.5:8080");
  assert(config.gateway().timeout_ms() == 30000);
  assert(config.deploy().projects_dir() == "/home/pi/projects");
  assert(config.deploy().log_dir() == "/tmp");
  assert(config.deploy().log_tail_lines() == 300);
  assert(config.deploy().stream_poll_interval_ms() == 1000);
  assert(config.deploy().stream_max_polls() == 600);
  assert(config.deploy().freshness_window_s() == 30);
  assert(config.deploy().default_strategy() == "pull_rebuild");
  assert(config.allowlist().path() == "./data/allowlist.json");
  assert(config.notifications().username() == "shipyard");
}

void TestFullDocumentParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
gateway:
  url: "https://gw.internal"
  token: "abc"
  timeout_ms: 5000
database:
  sqlite:
    path: "/var/lib/shipyard/deploys.db"
    wal_mode: true
allowlist:
  path: "/var/lib/shipyard/allowlist.json"
  seed:
    repo_paths: ["/srv/web"]
    compose_projects: ["webapp"]
    container_names: ["web-1"]
deploy:
  log_dir: "/var/log/shipyard"
  default_strategy: "rebuild_only"
classifier:
  extra_rules:
    - pattern: "quota exceeded"
      kind: "quota"
      message: "Registry quota exceeded"
projects:
  - id: "p-web"
    name: "Web App"
    services:
      - id: "svc-web"
        name: "web"
        type: "docker"
        compose_project: "webapp"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.gateway().timeout_ms() == 5000);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.allowlist().seed().repo_paths_size() == 1);
  assert(config.allowlist().seed().container_names(0) == "web-1");
  assert(config.deploy().log_dir() == "/var/log/shipyard");
  assert(config.deploy().default_strategy() == "rebuild_only");
  assert(config.classifier().extra_rules_size() == 1);
  assert(config.classifier().extra_rules(0).kind() == "quota");
  assert(config.projects_size() == 1);
  assert(config.projects(0).services(0).compose_project() == "webapp");
}

void TestTokenFromEnvironment() {
  setenv("SHIPYARD_TEST_GATEWAY_TOKEN", "from-env", 1);

  const auto yaml_path = WriteYaml("token_env",
                                   R"(gateway:
  url: "http://gw:8080"
  token_env: "SHIPYARD_TEST_GATEWAY_TOKEN"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.gateway().token() == "from-env");

  unsetenv("SHIPYARD_TEST_GATEWAY_TOKEN");
  assert(LoadThrowsConfigurationError(yaml_path));
}

void TestMissingGatewayIsRejected() {
  assert(LoadThrowsConfigurationError(WriteYaml("no_url", R"(gateway:
  token: "abc"
)")));

  assert(LoadThrowsConfigurationError(WriteYaml("no_token", R"(gateway:
  url: "http://gw:8080"
)")));

  assert(LoadThrowsConfigurationError(WriteYaml("bad_scheme", R"(gateway:
  url: "gw:8080"
  token: "abc"
)")));
}

void TestRelativeLogDirIsRejected() {
  assert(LoadThrowsConfigurationError(WriteYaml("relative_log_dir", R"(gateway:
  url: "http://gw:8080"
  token: "abc"
deploy:
  log_dir: "logs"
)")));
}

void TestUnknownFieldsAreRejected() {
  assert(LoadThrowsConfigurationError(WriteYaml("unknown_field", R"(gateway:
  url: "http://gw:8080"
  token: "abc"
unknown_field: 123
)")));
}

void TestMissingFileIsRejected() {
  assert(LoadThrowsConfigurationError(std::filesystem::temp_directory_path() / "shipyard_config_loader_tests" / "absent.yaml"));
}

} // namespace

int main() {
  TestDefaultsAreApplied();
  TestFullDocumentParses();
  TestTokenFromEnvironment();
  TestMissingGatewayIsRejected();
  TestRelativeLogDirIsRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "shipyard_unit_config_loader: pass\n";
  return 0;
}
