// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска и чтения файлов правил (GoogleTest)
// ==============================================================================

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sigmaeval/discovery.hpp>
#include <sigmaeval/output.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace sigmaeval::io::test {

// ==============================================================================
// Test Fixture: создаёт временную структуру директорий для тестов
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        // Имя теста + PID: тесты не мешают друг другу при ctest -j
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("sigmaeval_discovery_") +
                                  test_info->test_case_name() + "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path, const std::string& content = "title: x\n") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }
};

// ==============================================================================
// discover_files
// ==============================================================================

TEST_F(DiscoveryTest, DefaultExtensions_FindYmlAndYaml) {
    create_file(test_dir_ / "a.yml");
    create_file(test_dir_ / "b.yaml");
    create_file(test_dir_ / "notes.txt");
    create_file(test_dir_ / "rule.json");

    auto result = discover_files({test_dir_}, DiscoveryOptions{});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].filename(), "a.yml");
    EXPECT_EQ(result[1].filename(), "b.yaml");
}

TEST_F(DiscoveryTest, ExtensionsCompareCaseInsensitively) {
    create_file(test_dir_ / "upper.YML");
    create_file(test_dir_ / "mixed.Yaml");

    auto result = discover_files({test_dir_}, DiscoveryOptions{});

    EXPECT_EQ(result.size(), 2u);
}

TEST_F(DiscoveryTest, SingleFileInput) {
    std::filesystem::path file_path = test_dir_ / "single.yml";
    create_file(file_path);

    auto result = discover_files({file_path}, DiscoveryOptions{});

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], file_path);
}

TEST_F(DiscoveryTest, EmptyDirectory_IsNotAnError) {
    std::filesystem::create_directories(test_dir_ / "empty");

    auto result = discover_files({test_dir_ / "empty"}, DiscoveryOptions{});

    EXPECT_TRUE(result.empty());
}

TEST_F(DiscoveryTest, RecursiveTraversal) {
    create_file(test_dir_ / "root.yml");
    create_file(test_dir_ / "windows" / "process_creation" / "proc.yml");
    create_file(test_dir_ / "linux" / "auditd" / "deep" / "audit.yaml");

    auto result = discover_files({test_dir_}, DiscoveryOptions{});

    EXPECT_EQ(result.size(), 3u);
}

TEST_F(DiscoveryTest, NoExtensionFilter_FindsEverything) {
    create_file(test_dir_ / "a.yml");
    create_file(test_dir_ / "b.txt");
    create_file(test_dir_ / "README");

    DiscoveryOptions opt;
    opt.extensions = std::nullopt;

    auto result = discover_files({test_dir_}, opt);

    EXPECT_EQ(result.size(), 3u);
}

TEST_F(DiscoveryTest, MissingPath_Throws) {
    EXPECT_THROW(discover_files({test_dir_ / "does_not_exist"}, DiscoveryOptions{}),
                 std::runtime_error);
}

TEST_F(DiscoveryTest, MissingPath_SkipErrorsWarns) {
    output::OutputConfig config;
    output::Writer writer(config);
    DiscoveryOptions opt;
    opt.skip_errors = true;
    opt.writer = &writer;

    ::testing::internal::CaptureStderr();
    auto result = discover_files({test_dir_ / "does_not_exist", test_dir_}, opt);
    std::string captured = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(result.empty());
    EXPECT_NE(captured.find("[!]"), std::string::npos);
    EXPECT_NE(captured.find("does not exist"), std::string::npos);
}

TEST_F(DiscoveryTest, PathWithSpaces) {
    std::filesystem::path file_path = test_dir_ / "path with spaces" / "my rule.yml";
    create_file(file_path);

    auto result = discover_files({test_dir_ / "path with spaces"}, DiscoveryOptions{});

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], file_path);
}

TEST_F(DiscoveryTest, DeterministicSortedOrder) {
    create_file(test_dir_ / "z" / "rule.yml");
    create_file(test_dir_ / "a" / "rule.yml");
    create_file(test_dir_ / "m_rule.yml");

    auto first = discover_files({test_dir_}, DiscoveryOptions{});
    auto second = discover_files({test_dir_}, DiscoveryOptions{});

    EXPECT_EQ(first, second);
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
}

TEST_F(DiscoveryTest, MultipleInputsAreMergedAndSorted) {
    create_file(test_dir_ / "b" / "two.yml");
    create_file(test_dir_ / "a" / "one.yml");

    auto result = discover_files({test_dir_ / "b", test_dir_ / "a"}, DiscoveryOptions{});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].filename(), "one.yml");
}

// ==============================================================================
// read_text_file
// ==============================================================================

TEST_F(DiscoveryTest, ReadTextFile_ReturnsBytesUnchanged) {
    const std::string content = "title: Rule\r\ndetection:\n  condition: selection\n";
    create_file(test_dir_ / "rule.yml", content);

    auto read = read_text_file(test_dir_ / "rule.yml");

    ASSERT_TRUE(read.ok);
    EXPECT_TRUE(static_cast<bool>(read));
    EXPECT_EQ(read.content, content);
}

TEST_F(DiscoveryTest, ReadTextFile_MissingFileIsError) {
    auto read = read_text_file(test_dir_ / "absent.yml");

    EXPECT_FALSE(read.ok);
    EXPECT_NE(read.error.find("failed to open file"), std::string::npos);
}

}  // namespace sigmaeval::io::test
