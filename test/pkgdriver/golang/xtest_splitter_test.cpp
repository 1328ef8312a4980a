#include "pkgdriver/golang/xtest_splitter.hpp"

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

using pkgdriver::golang::GoSourceScanner;
using pkgdriver::golang::XTestSplitter;
using pkgdriver::test::FileTestFixture;
using pkgdriver::test::MakeNode;

using Files = std::vector<std::string>;

class SplitterFixture : public FileTestFixture {
 public:
  SplitterFixture()
      : FileTestFixture("pkgdriver_xtest_splitter"),
        splitter_(std::make_shared<GoSourceScanner>()) {
  }

  auto Create(std::string_view name, std::string_view content) const
      -> std::string {
    return CreateFile(name, content).string();
  }

  [[nodiscard]] auto Splitter() const -> const XTestSplitter& {
    return splitter_;
  }

 private:
  XTestSplitter splitter_;
};

TEST_CASE_METHOD(
    SplitterFixture, "XTestSplitter moves external test files", "[xtest]") {
  auto lib = Create("lib.go", "package lib\nimport \"strings\"\n");
  auto internal_test =
      Create("lib_internal_test.go", "package lib\nimport \"testing\"\n");
  auto external_test = Create(
      "lib_test.go",
      "package lib_test\n"
      "import (\n\"testing\"\n\"example.com/lib\"\n\"example.com/other\"\n)\n");

  auto node = MakeNode(
      "example.com/lib", {lib, internal_test, external_test},
      {{"strings", "strings"},
       {"testing", "testing"},
       {"example.com/lib", std::nullopt}});
  node.id = "example.com/lib";
  node.name = "lib";
  node.compiled_go_files = node.go_files;

  auto xtest = Splitter().SplitExternalTests(node);

  REQUIRE(xtest.has_value());
  REQUIRE(xtest->id == "example.com/lib_xtest");
  REQUIRE(xtest->pkg_path == "example.com/lib_test");
  REQUIRE(xtest->name == "lib_test");
  REQUIRE(xtest->synthesized_test);
  REQUIRE(xtest->go_files == Files{external_test});
  REQUIRE(xtest->compiled_go_files == Files{external_test});

  // Imports map to the parent's edges, the parent itself, or nothing
  REQUIRE(xtest->imports.at("testing") == "testing");
  REQUIRE(xtest->imports.at("example.com/lib") == "example.com/lib");
  REQUIRE_FALSE(xtest->imports.at("example.com/other").has_value());

  // The parent keeps its own sources and internal tests
  REQUIRE(node.go_files == Files{lib, internal_test});
  REQUIRE(node.compiled_go_files == Files{lib, internal_test});
  REQUIRE_FALSE(node.imports.contains("example.com/lib"));
}

TEST_CASE_METHOD(
    SplitterFixture, "XTestSplitter leaves packages without xtests",
    "[xtest]") {
  auto lib = Create("util.go", "package util\n");
  auto test = Create("util_test.go", "package util\nimport \"testing\"\n");

  auto node = MakeNode("example.com/util", {lib, test});
  node.id = "example.com/util";

  REQUIRE_FALSE(Splitter().SplitExternalTests(node).has_value());
  REQUIRE(node.go_files == Files{lib, test});
}

TEST_CASE_METHOD(
    SplitterFixture, "XTestSplitter derives the name from the test package",
    "[xtest]") {
  auto test = Create("api_test.go", "package api_test\n");

  auto node = MakeNode("example.com/api", {test});
  node.id = "example.com/api";

  auto xtest = Splitter().SplitExternalTests(node);

  REQUIRE(xtest.has_value());
  REQUIRE(xtest->name == "api_test");
  REQUIRE(node.go_files.empty());
}

TEST_CASE_METHOD(
    SplitterFixture, "XTestSplitter keeps unreadable test files", "[xtest]") {
  auto missing = (GetTempDir() / "missing_test.go").string();

  auto node = MakeNode("example.com/lib", {missing});
  node.id = "example.com/lib";

  REQUIRE_FALSE(Splitter().SplitExternalTests(node).has_value());
  REQUIRE(node.go_files == Files{missing});
}

TEST_CASE_METHOD(
    SplitterFixture, "XTestSplitter splits files missing from compiled files",
    "[xtest]") {
  auto lib = Create("lib.go", "package lib\n");
  auto external_test = Create("lib_test.go", "package lib_test\n");

  auto node = MakeNode("example.com/lib", {lib, external_test});
  node.id = "example.com/lib";
  node.compiled_go_files = {lib};

  auto xtest = Splitter().SplitExternalTests(node);

  REQUIRE(xtest.has_value());
  REQUIRE(xtest->go_files == Files{external_test});
  REQUIRE(xtest->compiled_go_files == Files{external_test});
  REQUIRE(node.go_files == Files{lib});
  REQUIRE(node.compiled_go_files == Files{lib});
}
