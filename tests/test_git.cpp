#include <boost/ut.hpp>
#include <filesystem> // std::filesystem::{temp_directory_path, create_directories, remove_all}
#include <format>     // std::format
#include <fstream>    // std::ofstream
#include <unistd.h>   // getpid

#include <CCStatus/Services/Git.hpp>
#include <CCStatus/Utils/Types.hpp>

using namespace boost::ut;
using namespace ccstatus::services::git;
using namespace ccstatus::utils::types;

using ccstatus::utils::error::StatusErrorCode;

namespace {
  /// A fake repository: `<tmp>/repo/.git/HEAD` and `<tmp>/repo/src/deep`.
  class FakeRepo {
   public:
    explicit FakeRepo(const StringView head)
      : m_root(fs::temp_directory_path() / std::format("ccstatus-git-{}", getpid())) {
      fs::remove_all(m_root);
      fs::create_directories(m_root / "repo" / ".git");
      fs::create_directories(m_root / "repo" / "src" / "deep");
      fs::create_directories(m_root / "elsewhere");
      std::ofstream(m_root / "repo" / ".git" / "HEAD") << head;
    }

    FakeRepo(const FakeRepo&)                    = delete;
    FakeRepo(FakeRepo&&)                         = delete;
    auto operator=(const FakeRepo&) -> FakeRepo& = delete;
    auto operator=(FakeRepo&&) -> FakeRepo&      = delete;

    ~FakeRepo() {
      std::error_code errc;
      fs::remove_all(m_root, errc);
    }

    [[nodiscard]] auto root() const -> const fs::path& {
      return m_root;
    }

   private:
    fs::path m_root;
  };
} // namespace

auto main() -> int {
  "HEAD on a branch"_test = [] -> void {
    expect(ParseHead("ref: refs/heads/main\n") == String("main"));
    expect(ParseHead("ref: refs/heads/feature/status-bar") == String("feature/status-bar"));
  };

  "Detached HEAD is shortened"_test = [] -> void {
    expect(ParseHead("0123456789abcdef0123456789abcdef01234567\n") == String("0123456"));
  };

  "Unrecognised HEAD"_test = [] -> void {
    Result<String> branch = ParseHead("abc");

    expect(!branch.has_value());
    expect(branch.error().code == StatusErrorCode::ParseError);
  };

  "Porcelain line count"_test = [] -> void {
    expect(CountPorcelainLines("") == 0);
    expect(CountPorcelainLines("\n") == 0);
    expect(CountPorcelainLines(" M src/main.cpp\n") == 1);
    expect(CountPorcelainLines(" M a\n?? b\nD  c\n") == 3);
  };

  "Finds .git from a nested directory"_test = [] -> void {
    const FakeRepo repo("ref: refs/heads/dev\n");

    Result<fs::path> gitDir = FindGitDir(repo.root() / "repo" / "src" / "deep");

    expect(gitDir.has_value());
    expect(*gitDir == repo.root() / "repo" / ".git");
    expect(ReadBranch(*gitDir) == String("dev"));
  };

  "Directories outside a repository"_test = [] -> void {
    const FakeRepo repo("ref: refs/heads/dev\n");

    Result<fs::path> gitDir = FindGitDir(repo.root() / "elsewhere");

    expect(!gitDir.has_value());
    expect(gitDir.error().code == StatusErrorCode::NotFound);
    expect(!GetGitInfo(repo.root() / "elsewhere").has_value());
  };

  "Git summary for a repository"_test = [] -> void {
    const FakeRepo repo("ref: refs/heads/dev\n");

    Result<ccstatus::core::session::GitSummary> summary = GetGitInfo(repo.root() / "repo" / "src");

    expect(summary.has_value());
    expect(summary->branch == String("dev"));
    // Not a real repository, so git status reports nothing.
    expect(summary->changes == 0);
  };

  return 0;
}
