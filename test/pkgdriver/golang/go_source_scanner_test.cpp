#include "pkgdriver/golang/go_source_scanner.hpp"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/pkgdriver/common/file_fixture.hpp"
#include "test/pkgdriver/common/package_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using pkgdriver::DriverErrorCode;
using pkgdriver::golang::GoImportScanner;
using pkgdriver::golang::GoSourceScanner;
using pkgdriver::test::FileTestFixture;

using Imports = std::vector<std::string>;

TEST_CASE("ParseHeader reads single imports", "[go_scanner]") {
  auto header = GoSourceScanner::ParseHeader(R"(package main

import "fmt"
import "os"

func main() {}
)");

  REQUIRE(header.has_value());
  REQUIRE(header->package_name == "main");
  REQUIRE(header->imports == Imports{"fmt", "os"});
}

TEST_CASE("ParseHeader reads grouped and named imports", "[go_scanner]") {
  auto header = GoSourceScanner::ParseHeader(R"(// Copyright notice
/* block
   comment */
package server // trailing

import (
	"context"
	stdlog "log"
	. "example.com/dsl"
	_ "example.com/driver" // side effects
	`example.com/raw`
)

import "C"

var x = "not/an/import"
)");

  REQUIRE(header.has_value());
  REQUIRE(header->package_name == "server");
  REQUIRE(
      header->imports == Imports{"context", "log", "example.com/dsl",
                                 "example.com/driver", "example.com/raw", "C"});
}

TEST_CASE("ParseHeader accepts files without imports", "[go_scanner]") {
  auto header = GoSourceScanner::ParseHeader("package util; const X = 1\n");

  REQUIRE(header.has_value());
  REQUIRE(header->package_name == "util");
  REQUIRE(header->imports.empty());
}

TEST_CASE("ParseHeader rejects malformed headers", "[go_scanner]") {
  SECTION("Missing package clause") {
    REQUIRE_FALSE(GoSourceScanner::ParseHeader("import \"fmt\"\n").has_value());
  }

  SECTION("Unterminated import group") {
    REQUIRE_FALSE(
        GoSourceScanner::ParseHeader("package a\nimport (\n\"fmt\"\n")
            .has_value());
  }

  SECTION("Unterminated import path") {
    REQUIRE_FALSE(
        GoSourceScanner::ParseHeader("package a\nimport \"fmt\n").has_value());
  }

  SECTION("Unterminated block comment") {
    REQUIRE_FALSE(GoSourceScanner::ParseHeader("/* package a").has_value());
  }
}

TEST_CASE("ScanFile reports missing files", "[go_scanner]") {
  GoSourceScanner scanner;

  auto header = scanner.ScanFile("/nonexistent/pkgdriver/missing.go");

  REQUIRE_FALSE(header.has_value());
  REQUIRE(header.error().code() == DriverErrorCode::FileNotFound);
}

TEST_CASE("ScanFile reports parse failures", "[go_scanner]") {
  FileTestFixture fixture("pkgdriver_scanner_parse");
  auto path = fixture.CreateFile("broken.go", "func main() {}\n");
  GoSourceScanner scanner;

  auto header = scanner.ScanFile(path);

  REQUIRE_FALSE(header.has_value());
  REQUIRE(header.error().code() == DriverErrorCode::ParseFailed);
}

TEST_CASE("GoImportScanner merges imports of all sources", "[go_scanner]") {
  FileTestFixture fixture("pkgdriver_import_scanner");
  auto a = fixture.CreateFile("a.go", "package lib\nimport (\"fmt\"\n\"os\")\n");
  auto b = fixture.CreateFile("b.go", "package lib\nimport \"os\"\nimport \"io\"\n");
  GoImportScanner scanner(std::make_shared<GoSourceScanner>());

  SECTION("Compiled files are included") {
    auto node = pkgdriver::test::MakeNode("lib", {a.string()});
    node.compiled_go_files = {a.string(), b.string()};

    auto imports = scanner.ScanImports(node);

    REQUIRE(imports.has_value());
    REQUIRE(*imports == Imports{"fmt", "os", "io"});
  }

  SECTION("Merged go files missing from the compiled list are included") {
    auto node = pkgdriver::test::MakeNode("lib", {a.string(), b.string()});
    node.compiled_go_files = {a.string()};

    auto imports = scanner.ScanImports(node);

    REQUIRE(imports.has_value());
    REQUIRE(*imports == Imports{"fmt", "os", "io"});
  }

  SECTION("Go files are used when nothing was compiled") {
    auto node = pkgdriver::test::MakeNode("lib", {b.string()});

    auto imports = scanner.ScanImports(node);

    REQUIRE(imports.has_value());
    REQUIRE(*imports == Imports{"os", "io"});
  }

  SECTION("A missing file fails the scan") {
    auto node = pkgdriver::test::MakeNode(
        "lib", {a.string(), (fixture.GetTempDir() / "gone.go").string()});

    auto imports = scanner.ScanImports(node);

    REQUIRE_FALSE(imports.has_value());
    REQUIRE(imports.error().code() == DriverErrorCode::FileNotFound);
  }
}
