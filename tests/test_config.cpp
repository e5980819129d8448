#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.session().host, "");
    EXPECT_EQ(c.session().port, 22);
    EXPECT_EQ(c.session().timeout, 30);
    EXPECT_EQ(c.session().term, "xterm");
    EXPECT_FALSE(c.session().password.has_value());
    EXPECT_FALSE(c.session().ssh_key_path.has_value());

    EXPECT_TRUE(c.local_echo().enabled);
    EXPECT_EQ(c.local_echo().pause_ms, 500);
    EXPECT_TRUE(c.local_echo().pause_on_tab);
    EXPECT_TRUE(c.local_echo().pause_on_interrupt);

    EXPECT_EQ(c.diagnostics().dump_path, "");
    EXPECT_TRUE(c.diagnostics().debug_log);
}

TEST(Config, ParsesAllSections) {
    auto r = Config::parse(R"(
session:
  host: "build.example.org"
  port: 2222
  user: "ops"
  password: "secret"
  ssh_key_path: "/keys/id_ed25519"
  timeout: 10
  term: "xterm-256color"
local_echo:
  enabled: false
  pause_ms: 750
  pause_on_tab: false
  pause_on_interrupt: false
diagnostics:
  dump_path: "/var/log/echoterm.log"
  debug_log: false
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.session().host, "build.example.org");
    EXPECT_EQ(c.session().port, 2222);
    EXPECT_EQ(c.session().user, "ops");
    EXPECT_EQ(c.session().password.value_or(""), "secret");
    EXPECT_EQ(c.session().ssh_key_path.value_or(""), "/keys/id_ed25519");
    EXPECT_EQ(c.session().timeout, 10);
    EXPECT_EQ(c.session().term, "xterm-256color");

    EXPECT_FALSE(c.local_echo().enabled);
    EXPECT_EQ(c.local_echo().pause_ms, 750);
    EXPECT_FALSE(c.local_echo().pause_on_tab);
    EXPECT_FALSE(c.local_echo().pause_on_interrupt);

    EXPECT_EQ(c.diagnostics().dump_path, "/var/log/echoterm.log");
    EXPECT_FALSE(c.diagnostics().debug_log);
}

TEST(Config, NegativePauseClampsToZero) {
    auto r = Config::parse("local_echo:\n  pause_ms: -20\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.local_echo().pause_ms, 0);
}

TEST(Config, PortOutOfRangeIsAnError) {
    auto r = Config::parse("session:\n  port: 70000\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("session.port"), std::string::npos);

    EXPECT_TRUE(Config::parse("session:\n  port: 0\n").is_err());
    EXPECT_TRUE(Config::parse("session:\n  port: 65535\n").is_ok());
}

TEST(Config, MalformedYamlIsAnError) {
    auto r = Config::parse("session: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, LoadMissingFile) {
    auto r = Config::load_file(fs::temp_directory_path() / "echoterm_missing_config.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

// ── apply_target ─────────────────────────────────────────────

TEST(Config, TargetHostOnly) {
    Config c;
    ASSERT_TRUE(c.apply_target("example.org").is_ok());
    EXPECT_EQ(c.session().host, "example.org");
    EXPECT_EQ(c.session().port, 22);
    EXPECT_EQ(c.session().user, "");
}

TEST(Config, TargetUserHostPort) {
    Config c;
    ASSERT_TRUE(c.apply_target(" alice@10.0.0.5:2200 ").is_ok());
    EXPECT_EQ(c.session().user, "alice");
    EXPECT_EQ(c.session().host, "10.0.0.5");
    EXPECT_EQ(c.session().port, 2200);
}

TEST(Config, TargetRejectsBadPort) {
    Config c;
    EXPECT_TRUE(c.apply_target("host:abc").is_err());
    EXPECT_TRUE(c.apply_target("host:0").is_err());
    EXPECT_TRUE(c.apply_target("host:70000").is_err());
}

TEST(Config, TargetRejectsMissingHost) {
    Config c;
    EXPECT_TRUE(c.apply_target("").is_err());
    EXPECT_TRUE(c.apply_target("bob@").is_err());
    EXPECT_TRUE(c.apply_target(":22").is_err());
}

// ── Global config file ───────────────────────────────────────

class GlobalConfigTest : public ::testing::Test {
protected:
    fs::path home;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        home = fs::temp_directory_path() / "echoterm_config_test";
        fs::remove_all(home);
        fs::create_directories(home);

        if (const char* h = std::getenv("ECHOTERM_HOME")) {
            had_home = true;
            saved_home = h;
        }
        setenv("ECHOTERM_HOME", home.c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            setenv("ECHOTERM_HOME", saved_home.c_str(), 1);
        } else {
            unsetenv("ECHOTERM_HOME");
        }
        fs::remove_all(home);
    }
};

TEST_F(GlobalConfigTest, PathsLiveUnderHome) {
    EXPECT_EQ(get_global_config_dir(), home / ".echoterm");
    EXPECT_EQ(get_global_config_path(), home / ".echoterm" / "config.yaml");
}

TEST_F(GlobalConfigTest, MissingGlobalConfig) {
    EXPECT_FALSE(global_config_exists());
    EXPECT_TRUE(Config::load_global().is_err());
}

TEST_F(GlobalConfigTest, DefaultConfigRoundTrips) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());

    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().port, 22);
    EXPECT_TRUE(r.value.local_echo().enabled);
    EXPECT_EQ(r.value.local_echo().pause_ms, 500);
}

TEST_F(GlobalConfigTest, DefaultConfigDoesNotOverwrite) {
    fs::create_directories(get_global_config_dir());
    std::ofstream(get_global_config_path()) << "session:\n  host: keep.me\n";

    ASSERT_TRUE(create_default_global_config().is_ok());
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().host, "keep.me");
}

TEST_F(GlobalConfigTest, KeyPathExpandsHome) {
    auto r = Config::parse("session:\n  ssh_key_path: \"~/.ssh/id_rsa\"\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.session().ssh_key_path.value_or(""), (home / ".ssh/id_rsa").string());
}
