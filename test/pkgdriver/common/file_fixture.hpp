#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace pkgdriver::test {

// Base fixture for tests that need temporary file management
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("pkgdriver_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    // Use TEST_TMPDIR when the test runner provides one
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / prefix;
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;
  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> const std::filesystem::path& {
    return temp_dir_;
  }

  // Create a file (and its parent directories) under the temp directory
  auto CreateFile(std::string_view filename, std::string_view content) const
      -> std::filesystem::path {
    auto file_path = temp_dir_ / filename;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path);
    file << content;
    file.close();
    return file_path;
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace pkgdriver::test
