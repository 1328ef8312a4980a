#include "pkgdriver/core/identifier.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/pkgdriver/common/package_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using pkgdriver::CanonicalizeImportId;
using pkgdriver::IsSuperset;
using pkgdriver::RewritePackage;
using pkgdriver::test::MakeNode;
using pkgdriver::test::MakeStdlibNode;

using Files = std::vector<std::string>;

TEST_CASE("CanonicalizeImportId unwraps stdlib ids", "[identifier]") {
  auto importer = MakeNode("example.com/app");
  auto stdlib_importer = MakeStdlibNode("net/http");

  REQUIRE(
      CanonicalizeImportId("fmt", "@@io_bazel_rules_go//stdlib:fmt", importer) ==
      "fmt");
  REQUIRE(
      CanonicalizeImportId(
          "fmt", "@@io_bazel_rules_go//stdlib:fmt", stdlib_importer) == "fmt");
}

TEST_CASE("CanonicalizeImportId keeps ids of stdlib importers", "[identifier]") {
  auto importer = MakeStdlibNode("net/http");

  REQUIRE(
      CanonicalizeImportId("crypto/tls", "crypto/tls_internal_id", importer) ==
      "crypto/tls_internal_id");
}

TEST_CASE(
    "CanonicalizeImportId uses the import path for other importers",
    "[identifier]") {
  auto importer = MakeNode("example.com/app");

  REQUIRE(
      CanonicalizeImportId("example.com/foo", "X", importer) ==
      "example.com/foo");
  REQUIRE(
      CanonicalizeImportId(
          "example.com/foo", "@//foo:go_default_library", importer) ==
      "example.com/foo");
}

TEST_CASE("RewritePackage forces identity to logical path", "[identifier]") {
  auto node = MakeNode(
      "example.com/app", {"main.go"},
      {{"example.com/lib", "@//lib:go_default_library"},
       {"fmt", "@@io_bazel_rules_go//stdlib:fmt"}});
  node.id = "@//app:go_default_library";

  RewritePackage(node);

  REQUIRE(node.id == "example.com/app");
  REQUIRE(node.imports.at("example.com/lib") == "example.com/lib");
  REQUIRE(node.imports.at("fmt") == "fmt");
}

TEST_CASE("RewritePackage handles unresolved edges", "[identifier]") {
  SECTION("Non-stdlib node keys the edge by its import path") {
    auto node = MakeNode("example.com/app", {}, {{"example.com/lib", std::nullopt}});
    RewritePackage(node);
    REQUIRE(node.imports.at("example.com/lib") == "example.com/lib");
  }

  SECTION("Stdlib node keeps the edge unresolved") {
    auto node = MakeStdlibNode("net/http", {{"internal/x", std::nullopt}});
    RewritePackage(node);
    REQUIRE_FALSE(node.imports.at("internal/x").has_value());
  }
}

TEST_CASE("IsSuperset is an ordered subsequence test", "[identifier]") {
  SECTION("Empty sequence is contained in anything") {
    REQUIRE(IsSuperset({}, {}));
    REQUIRE(IsSuperset({"a.go"}, {}));
  }

  SECTION("Longer b is never contained") {
    REQUIRE_FALSE(IsSuperset({"a.go"}, {"a.go", "b.go"}));
    REQUIRE_FALSE(IsSuperset({}, {"a.go"}));
  }

  SECTION("Interleaved elements keep order") {
    REQUIRE(IsSuperset({"a.go", "c.go", "b.go"}, {"a.go", "b.go"}));
    REQUIRE(IsSuperset({"a.go", "b.go"}, {"a.go", "b.go"}));
  }

  SECTION("Same elements in another order are not contained") {
    REQUIRE_FALSE(IsSuperset({"b.go", "a.go"}, {"a.go", "b.go"}));
  }

  SECTION("Partial overlap is not enough") {
    REQUIRE_FALSE(IsSuperset({"a.go", "c.go"}, {"a.go", "b.go"}));
  }

  SECTION("Duplicates are matched by position") {
    REQUIRE(IsSuperset({"a.go", "a.go"}, {"a.go", "a.go"}));
    REQUIRE_FALSE(IsSuperset({"a.go", "b.go"}, {"a.go", "a.go"}));
  }
}
