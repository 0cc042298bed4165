#include <boost/ut.hpp>

#include <CCStatus/Utils/Error.hpp>

using namespace boost::ut;
using namespace ccstatus::utils::error;
using namespace ccstatus::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(StatusErrorCode::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1; // Should not reach here
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1; // Should be 43
  }

  auto try_void_helper(const bool fail) -> Result<> {
    TRY_VOID(fail ? Result<>(Err(StatusError(StatusErrorCode::IoError, "read failed"))) : Result<>());
    return {};
  }
} // namespace

auto main() -> int {
  "StatusError construction"_test = [] -> void {
    StatusError err(StatusErrorCode::NotFound, "Item not found");

    expect(err.code == StatusErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == StatusErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
  };

  "TRY_VOID macro"_test = [] -> void {
    expect(try_void_helper(false).has_value());

    Result<> res = try_void_helper(true);

    expect(!res.has_value());
    expect(res.error().code == StatusErrorCode::IoError);
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(StatusErrorCode::InternalError, "internal error");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().code == StatusErrorCode::InternalError);
  };

  "ERR_FMT macro"_test = [] -> void {
    auto func = [](const i32 lines) -> Result<void> {
      ERR_FMT(StatusErrorCode::ParseError, "Latency file has {} line(s), expected 3", lines);
    };

    Result<void> res = func(2);

    expect(!res.has_value());
    expect(res.error().message == String("Latency file has 2 line(s), expected 3"));
  };

  return 0;
}
