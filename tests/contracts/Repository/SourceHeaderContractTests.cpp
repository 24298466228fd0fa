// Repository: TermReel
// Component: Source Header Contract Tests
// Purpose: Every header and source in the tree opens with the repository
//          header block.
// Copyright (c) 2025 TermReel

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace termreel::tests::contracts {

namespace fs = std::filesystem;

namespace {

bool IsCppFile(const fs::path& path) {
  const std::string ext = path.extension().string();
  return ext == ".h" || ext == ".hpp" || ext == ".cpp";
}

// First `count` lines of `path`.
std::vector<std::string> LeadingLines(const fs::path& path, int count) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (static_cast<int>(lines.size()) < count && std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST(SourceHeaderContractTest, EveryFileCarriesRepositoryBlock) {
  const fs::path root(TERMREEL_SOURCE_DIR);
  int checked = 0;
  for (const char* dir : {"include", "src", "tests"}) {
    ASSERT_TRUE(fs::is_directory(root / dir)) << (root / dir);
    for (const auto& entry : fs::recursive_directory_iterator(root / dir)) {
      if (!entry.is_regular_file() || !IsCppFile(entry.path())) continue;
      ++checked;

      const std::vector<std::string> lines = LeadingLines(entry.path(), 6);
      ASSERT_GE(lines.size(), 3u) << entry.path();
      EXPECT_EQ(lines[0], "// Repository: TermReel") << entry.path();
      EXPECT_EQ(lines[1].rfind("// Component: ", 0), 0u) << entry.path();

      bool has_copyright = false;
      for (const std::string& line : lines) {
        if (line == "// Copyright (c) 2025 TermReel") has_copyright = true;
      }
      EXPECT_TRUE(has_copyright) << entry.path();
    }
  }
  EXPECT_GT(checked, 0);
}

TEST(SourceHeaderContractTest, FixtureHeadersDescribeTheirPurpose) {
  const fs::path fixtures = fs::path(TERMREEL_SOURCE_DIR) / "tests" / "fixtures";
  ASSERT_TRUE(fs::is_directory(fixtures));
  for (const auto& entry : fs::directory_iterator(fixtures)) {
    if (!entry.is_regular_file() || !IsCppFile(entry.path())) continue;
    const std::vector<std::string> lines = LeadingLines(entry.path(), 3);
    ASSERT_EQ(lines.size(), 3u) << entry.path();
    EXPECT_EQ(lines[2].rfind("// Purpose: ", 0), 0u) << entry.path();
  }
}

}  // namespace termreel::tests::contracts
