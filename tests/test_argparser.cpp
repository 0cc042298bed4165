#include <boost/ut.hpp>

#include <CCStatus/Utils/ArgumentParser.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace ccstatus::utils::argparse;
  using namespace ccstatus::utils::types;

  using ccstatus::utils::logging::LogLevel;

  "ArgumentParser flag"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    bool           doctor = false;
    parser.addArguments("-d", "--doctor").flag().bindTo(doctor);

    Vec<PCStr> args   = { "testprog", "--doctor" };
    Result<>   result = parser.parseInto(args);

    expect(result.has_value());
    expect(doctor);
    expect(parser.isUsed("-d"));
  };

  "ArgumentParser value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    String         theme;
    parser.addArguments("-t", "--theme").defaultValue("").bindTo(theme);

    Vec<PCStr> args   = { "testprog", "-t", "gruvbox" };
    Result<>   result = parser.parseInto(args);

    expect(result.has_value());
    expect(theme == String("gruvbox"));
  };

  "ArgumentParser default value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    String         theme = "unset";
    parser.addArguments("-t", "--theme").defaultValue("powerline").bindTo(theme);

    Vec<PCStr> args   = { "testprog" };
    Result<>   result = parser.parseInto(args);

    expect(result.has_value());
    expect(theme == String("powerline"));
    expect(!parser.isUsed("--theme"));
  };

  "ArgumentParser enum value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    LogLevel       level = LogLevel::Warn;
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn).bindToEnum(level);

    Vec<PCStr> args   = { "testprog", "--log-level", "DEBUG" };
    Result<>   result = parser.parseInto(args);

    expect(result.has_value());
    expect(level == LogLevel::Debug);
    expect(parser.getEnum<LogLevel>("-l") == LogLevel::Debug);
  };

  "ArgumentParser enum default"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Error);

    Vec<PCStr> args = { "testprog" };

    expect(parser.parseArgs(args).has_value());
    expect(parser.getEnum<LogLevel>("--log-level") == LogLevel::Error);
  };

  "ArgumentParser rejects disallowed choice"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn);

    Vec<PCStr> args   = { "testprog", "-l", "loud" };
    Result<>   result = parser.parseArgs(args);

    expect(!result.has_value());
    expect(result.error().code == ccstatus::utils::error::StatusErrorCode::InvalidArgument);
  };

  "Enum default restricts values to the enum names"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn);

    expect(parser.helpText().find("Available values: trace, debug, info, warn, error") != String::npos);

    Vec<PCStr> args = { "testprog", "--log-level", "DEBUG" };

    expect(parser.parseArgs(args).has_value());
    expect(parser.getEnum<LogLevel>("--log-level") == LogLevel::Debug);
  };

  "ArgumentParser missing value"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    parser.addArguments("-t").defaultValue("");

    Vec<PCStr> args   = { "testprog", "-t" };
    Result<>   result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser unknown argument"_test = [] -> void {
    ArgumentParser parser("testprog", "0.1.0");
    Vec<PCStr>     args   = { "testprog", "--unknown" };
    Result<>       result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser help and version"_test = [] -> void {
    ArgumentParser parser("testprog", "testprog 0.1.0");
    parser.addArguments("--json").help("Output the widget list as JSON").flag();

    Vec<PCStr> args = { "testprog", "--help", "-v" };

    expect(parser.parseArgs(args).has_value());
    expect(parser.helpRequested());
    expect(parser.versionRequested());
    expect(parser.getVersion() == String("testprog 0.1.0"));
    expect(parser.helpText().find("--json") != String::npos);
  };

  return 0;
}
