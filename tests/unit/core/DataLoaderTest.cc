#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "vault/core/DataLoader.hh"

namespace vault {

class DataLoaderTest : public ::testing::Test {
  protected:
    // Write a temp TOML file for file-based tests
    std::filesystem::path writeTempFile(const std::string& content, const std::string& name = "test.toml") {
        auto dir = std::filesystem::temp_directory_path() / "vault_dataloader_test";
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::ofstream ofs(path);
        ofs << content;
        ofs.close();
        return path;
    }

    void TearDown() override {
        auto dir = std::filesystem::temp_directory_path() / "vault_dataloader_test";
        std::filesystem::remove_all(dir);
    }
};

// -- DataLoader::parse --

TEST_F(DataLoaderTest, ParseValidToml) {
    auto result = DataLoader::parse(R"(
        [player]
        name = "Warden"
        keys = 3
        speed = 4.5
        muted = true
    )");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_EQ(loader.getString("player.name").value(), "Warden");
    EXPECT_EQ(loader.getInt("player.keys").value(), 3);
    EXPECT_DOUBLE_EQ(loader.getFloat("player.speed").value(), 4.5);
    EXPECT_TRUE(loader.getBool("player.muted").value());
}

TEST_F(DataLoaderTest, ParseMalformedToml) {
    auto result = DataLoader::parse("[invalid\nno_closing_bracket");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
    // Error message should contain line info
    EXPECT_NE(result.message().find(":"), std::string::npos);
}

TEST_F(DataLoaderTest, MissingKey) {
    auto result = DataLoader::parse("[section]\nkey = 1");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    auto missing = loader.getString("section.nonexistent");
    EXPECT_TRUE(missing.isError());
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
}

TEST_F(DataLoaderTest, TypeMismatch) {
    auto result = DataLoader::parse("[data]\nvalue = \"text\"");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    auto asInt = loader.getInt("data.value");
    EXPECT_TRUE(asInt.isError());
    EXPECT_EQ(asInt.code(), ErrorCode::InvalidState);

    auto asFloat = loader.getFloat("data.value");
    EXPECT_TRUE(asFloat.isError());
    EXPECT_NE(asFloat.message().find("data.value"), std::string::npos);
}

TEST_F(DataLoaderTest, HasKey) {
    auto result = DataLoader::parse("[a]\nb = 1");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_TRUE(loader.hasKey("a.b"));
    EXPECT_TRUE(loader.hasKey("a"));
    EXPECT_FALSE(loader.hasKey("a.c"));
    EXPECT_FALSE(loader.hasKey("z"));
    // Descending through a value is not a path
    EXPECT_FALSE(loader.hasKey("a.b.c"));
}

TEST_F(DataLoaderTest, FloatAcceptsInteger) {
    auto result = DataLoader::parse("[d]\nv = 10");
    ASSERT_TRUE(result.isOk());
    auto f = result.value().getFloat("d.v");
    ASSERT_TRUE(f.isOk());
    EXPECT_DOUBLE_EQ(f.value(), 10.0);
}

TEST_F(DataLoaderTest, SourceNameDefaultsToString) {
    auto result = DataLoader::parse("x = 1");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().sourceName(), "string");
}

// -- DataLoader::load (file-based) --

TEST_F(DataLoaderTest, LoadFromFile) {
    auto path = writeTempFile("[test]\nvalue = 99");
    auto result = DataLoader::load(path);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().getInt("test.value").value(), 99);
    EXPECT_NE(result.value().sourceName().find("test.toml"), std::string::npos);
}

TEST_F(DataLoaderTest, LoadMissingFile) {
    auto result = DataLoader::load("/nonexistent/path/missing.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

TEST_F(DataLoaderTest, LoadMalformedFileNamesThePath) {
    auto path = writeTempFile("[broken", "broken.toml");
    auto result = DataLoader::load(path);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.message().find("broken.toml"), std::string::npos);
}

} // namespace vault
