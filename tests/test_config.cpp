#include <boost/ut.hpp>
#include <filesystem> // std::filesystem::{path, current_path, temp_directory_path}
#include <format>     // std::format
#include <fstream>    // std::ofstream
#include <unistd.h>   // getpid

#include <CCStatus/Utils/Env.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "Config/Config.hpp"

using namespace boost::ut;
using namespace ccstatus::utils::types;

using ccstatus::config::Config;
using ccstatus::utils::env::SetEnv;
using ccstatus::utils::env::UnsetEnv;

namespace fs = std::filesystem;

namespace {
  /// Temporary directory that is also the working directory while it lives.
  class ScopedWorkDir {
   public:
    ScopedWorkDir()
      : m_path(fs::temp_directory_path() / std::format("ccstatus-config-{}", getpid())), m_previous(fs::current_path()) {
      fs::remove_all(m_path);
      fs::create_directories(m_path);
      fs::current_path(m_path);
    }

    ScopedWorkDir(const ScopedWorkDir&)                    = delete;
    ScopedWorkDir(ScopedWorkDir&&)                         = delete;
    auto operator=(const ScopedWorkDir&) -> ScopedWorkDir& = delete;
    auto operator=(ScopedWorkDir&&) -> ScopedWorkDir&      = delete;

    ~ScopedWorkDir() {
      std::error_code errc;
      fs::current_path(m_previous, errc);
      fs::remove_all(m_path, errc);
    }

    [[nodiscard]] auto path() const -> const fs::path& {
      return m_path;
    }

   private:
    fs::path m_path;
    fs::path m_previous;
  };
} // namespace

auto main() -> int {
  "Candidates come from XDG and HOME only"_test = [] -> void {
    SetEnv("XDG_CONFIG_HOME", "/xdg");
    SetEnv("HOME", "/home/alice");

    const Vec<fs::path> candidates = Config::getCandidatePaths();

    expect(fatal(candidates.size() == 3));
    expect(candidates[0] == fs::path("/xdg/ccstatus/config.toml"));
    expect(candidates[1] == fs::path("/home/alice/.config/ccstatus/config.toml"));
    expect(candidates[2] == fs::path("/home/alice/.ccstatus/config.toml"));
  };

  "A project config.toml in the working directory is not picked up"_test = [] -> void {
    const ScopedWorkDir workDir;

    SetEnv("HOME", (workDir.path() / "home").c_str());
    UnsetEnv("XDG_CONFIG_HOME");

    std::ofstream(workDir.path() / "config.toml") << "[tool.project]\nname = 42\n";

    expect(!Config::getConfigPath().has_value());
  };

  "Config in HOME is found"_test = [] -> void {
    const ScopedWorkDir workDir;
    const fs::path      home = workDir.path() / "home";

    SetEnv("HOME", home.c_str());
    UnsetEnv("XDG_CONFIG_HOME");

    fs::create_directories(home / ".ccstatus");
    std::ofstream(home / ".ccstatus" / "config.toml") << "[general]\ntheme = \"minimal\"\n";

    expect(Config::getConfigPath() == Option<fs::path>(home / ".ccstatus" / "config.toml"));
  };

  return 0;
}
