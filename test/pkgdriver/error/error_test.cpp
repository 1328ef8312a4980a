#include "pkgdriver/error/error.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(spdlog::level::warn);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using pkgdriver::DriverError;
using pkgdriver::DriverErrorCode;

TEST_CASE("DriverError prefixes details with the default message", "[error]") {
  auto error = DriverError::Make(
      DriverErrorCode::InvalidPackage, "app.pkg.json: missing PkgPath");

  REQUIRE(error.code() == DriverErrorCode::InvalidPackage);
  REQUIRE(
      error.message() ==
      "Invalid package record: app.pkg.json: missing PkgPath");
}

TEST_CASE("DriverError without details", "[error]") {
  REQUIRE(
      DriverError::Make(DriverErrorCode::FileNotFound).message() ==
      "File not found");
  REQUIRE(
      DriverError::Unexpected(DriverErrorCode::PathResolutionFailed)
          .error()
          .message() == "Path resolution failed");
}
