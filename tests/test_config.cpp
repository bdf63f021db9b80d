#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path home;

    void SetUp() override {
        home = fs::temp_directory_path() /
            (std::string("rjy_config_test_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(home);
        fs::create_directories(home);
        unsetenv(ENV_SESSIONS_FILE);
        unsetenv(ENV_CONFIG_FILE);
    }

    void TearDown() override {
        unsetenv(ENV_SESSIONS_FILE);
        unsetenv(ENV_CONFIG_FILE);
        fs::remove_all(home);
    }

    void write_config(const std::string& content) {
        std::ofstream(home / ".rjy.yaml") << content;
    }
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().program, "ssh");
    EXPECT_EQ(r.value.ssh().options, (std::vector<std::string>{"-Y", "-N"}));
    EXPECT_EQ(r.value.ssh().bind_address, "localhost");
    EXPECT_FALSE(r.value.sessions_file().has_value());
}

TEST_F(ConfigTest, EmptyFileGivesDefaults) {
    write_config("");
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().program, "ssh");
}

TEST_F(ConfigTest, ReadsAllKeys) {
    write_config(
        "ssh_program: /usr/local/bin/ssh\n"
        "ssh_options: [\"-N\", \"-o\", \"ServerAliveInterval=30\"]\n"
        "bind_address: 127.0.0.1\n"
        "sessions_file: ~/state/sessions.yaml\n");
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().program, "/usr/local/bin/ssh");
    EXPECT_EQ(r.value.ssh().options,
              (std::vector<std::string>{"-N", "-o", "ServerAliveInterval=30"}));
    EXPECT_EQ(r.value.ssh().bind_address, "127.0.0.1");
    ASSERT_TRUE(r.value.sessions_file().has_value());
    EXPECT_EQ(r.value.sessions_file()->string(), (home / "state" / "sessions.yaml").string());
}

TEST_F(ConfigTest, SingleOptionString) {
    write_config("ssh_options: -N\n");
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().options, (std::vector<std::string>{"-N"}));
}

TEST_F(ConfigTest, MalformedFileIsError) {
    write_config("ssh_options: [unterminated\n");
    EXPECT_TRUE(Config::load(home).is_err());
}

TEST_F(ConfigTest, NonMapIsError) {
    write_config("- a\n- b\n");
    EXPECT_TRUE(Config::load(home).is_err());
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
    fs::path alt = home / "alt.yaml";
    std::ofstream(alt) << "ssh_program: autossh\n";
    setenv(ENV_CONFIG_FILE, alt.c_str(), 1);

    EXPECT_EQ(get_config_path(home).string(), alt.string());
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().program, "autossh");
}

TEST_F(ConfigTest, SessionsPathDefault) {
    EXPECT_EQ(get_sessions_path(Config{}, home).string(),
              (home / ".remote_jupyter_sessions").string());
}

TEST_F(ConfigTest, SessionsPathPrecedence) {
    write_config("sessions_file: /tmp/from_config\n");
    auto r = Config::load(home);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(get_sessions_path(r.value, home).string(), "/tmp/from_config");

    setenv(ENV_SESSIONS_FILE, "/tmp/from_env", 1);
    EXPECT_EQ(get_sessions_path(r.value, home).string(), "/tmp/from_env");
}
