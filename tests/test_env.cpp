#include <boost/ut.hpp>

#include <CCStatus/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace ccstatus::utils::env;
  using namespace ccstatus::utils::error;
  using namespace ccstatus::utils::types;

  "GetEnv returns NotFound for missing variable"_test = [] -> void {
    Result<String> result = GetEnv("CCSTATUS_TEST_NONEXISTENT_VAR_12345");

    expect(!result.has_value());
    expect(result.error().code == StatusErrorCode::NotFound);
  };

  "SetEnv and GetEnv round-trip"_test = [] -> void {
    SetEnv("CCSTATUS_TEST_VAR", "test_value");
    Result<String> result = GetEnv("CCSTATUS_TEST_VAR");

    expect(result.has_value());
    expect(*result == String("test_value"));

    UnsetEnv("CCSTATUS_TEST_VAR");
  };

  "Empty variable counts as missing"_test = [] -> void {
    SetEnv("CCSTATUS_TEST_EMPTY", "");

    expect(!GetEnv("CCSTATUS_TEST_EMPTY").has_value());
    expect(GetEnvOr("CCSTATUS_TEST_EMPTY", "fallback") == String("fallback"));

    UnsetEnv("CCSTATUS_TEST_EMPTY");
  };

  "UnsetEnv removes variable"_test = [] -> void {
    SetEnv("CCSTATUS_TEST_VAR2", "value");
    UnsetEnv("CCSTATUS_TEST_VAR2");

    Result<String> result = GetEnv("CCSTATUS_TEST_VAR2");

    expect(!result.has_value());
  };

  return 0;
}
