#include "core/config_manager.hpp"
#include "test_base.hpp"
#include <cstdlib>

class ConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        clearEnv();
    }

    void TearDown() override
    {
        clearEnv();
        TestBase::TearDown();
    }

    static void clearEnv()
    {
        for (const char *name : {"MEMES_DIR", "DB_PATH", "LOG_DIR", "MEMES_URL_BASE", "REPLICATE_API_TOKEN"})
            ::unsetenv(name);
    }
};

TEST_F(ConfigManagerTest, EmptyConfigurationYieldsDefaults)
{
    ConfigManager config;
    PipelineSettings defaults;
    auto s = config.toSettings();
    EXPECT_EQ(s.media_root, defaults.media_root);
    EXPECT_EQ(s.gif_max_frames, 10);
    EXPECT_EQ(s.video_max_frames, 20);
    EXPECT_DOUBLE_EQ(s.video_fps, 2.0);
    EXPECT_EQ(s.ai_timeout_seconds, 120);
    EXPECT_EQ(s.sample_ref_mode, "url");
    EXPECT_EQ(s.image_extensions, defaults.image_extensions);
}

TEST_F(ConfigManagerTest, FileValuesOverrideDefaults)
{
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"({
        "paths": {"media_root": "/srv/memes", "database": "/srv/memelet.db"},
        "files": {"image_extensions": ["png", "jpg"]},
        "extraction": {"gif_max_frames": 6, "video_fps": 1.5},
        "ai": {"model": "some/model", "sample_ref_mode": "data_uri", "timeout_seconds": 30},
        "logging": {"level": "DEBUG"}
    })"));

    auto s = config.toSettings();
    EXPECT_EQ(s.media_root, "/srv/memes");
    EXPECT_EQ(s.database_path, "/srv/memelet.db");
    EXPECT_EQ(s.image_extensions, (std::vector<std::string>{"png", "jpg"}));
    EXPECT_EQ(s.gif_max_frames, 6);
    EXPECT_DOUBLE_EQ(s.video_fps, 1.5);
    EXPECT_EQ(s.ai_model, "some/model");
    EXPECT_EQ(s.sample_ref_mode, "data_uri");
    EXPECT_EQ(s.ai_timeout_seconds, 30);
    EXPECT_EQ(s.log_level, "DEBUG");
}

TEST_F(ConfigManagerTest, InvalidValuesFallBack)
{
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"({
        "extraction": {"gif_max_frames": 0, "video_fps": -1},
        "ai": {"sample_ref_mode": "carrier_pigeon", "timeout_seconds": 0}
    })"));

    auto s = config.toSettings();
    EXPECT_EQ(s.gif_max_frames, 1);
    EXPECT_DOUBLE_EQ(s.video_fps, 2.0);
    EXPECT_EQ(s.sample_ref_mode, "url");
    EXPECT_EQ(s.ai_timeout_seconds, 120);
}

TEST_F(ConfigManagerTest, EnvironmentWinsOverFile)
{
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"({"paths": {"media_root": "/from/file"}, "ai": {"api_token": "file-token"}})"));
    ::setenv("MEMES_DIR", "/from/env", 1);
    ::setenv("DB_PATH", "/env/db.sqlite", 1);
    ::setenv("LOG_DIR", "/env/logs", 1);
    ::setenv("MEMES_URL_BASE", "https://memes.example/files/", 1);
    ::setenv("REPLICATE_API_TOKEN", "env-token", 1);

    auto s = config.toSettings();
    EXPECT_EQ(s.media_root, "/from/env");
    EXPECT_EQ(s.database_path, "/env/db.sqlite");
    EXPECT_EQ(s.log_file, "/env/logs/scan.log");
    EXPECT_EQ(s.public_base_url, "https://memes.example/files/");
    EXPECT_EQ(s.ai_api_token, "env-token");
}

TEST_F(ConfigManagerTest, ApiTokenIsMaskedInDump)
{
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"({"ai": {"api_token": "secret", "model": "m"}})"));
    auto all = config.getAll();
    EXPECT_EQ(all["ai"]["api_token"], "***");
    EXPECT_EQ(all["ai"]["model"], "m");
    EXPECT_EQ(config.toSettings().ai_api_token, "secret");
}

TEST_F(ConfigManagerTest, MalformedInputIsRejected)
{
    ConfigManager config;
    EXPECT_FALSE(config.loadFromString("{not json"));
    EXPECT_FALSE(config.load((test_root_ / "missing.json").string()));

    writeFile("config.json", R"({"extraction": {"jpeg_quality": 75}})");
    ASSERT_TRUE(config.load(pathOf("config.json")));
    EXPECT_EQ(config.toSettings().jpeg_quality, 75);
}
