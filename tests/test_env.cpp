// tests/test_env.cpp
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "engine/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("PARCELLINK_CTL_SOCK");
    const std::string want = "/tmp/parcel-link-test.sock";
    g.set(want);

    // should NOT log "Listening on ..." when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Listening on") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("PARCELLINK_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "parcel-link-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/parcel-link/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Listening on " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace parcellink;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
    set_log_level_by_name("INFO");
}

TEST(Env_Config, OverridesTimers)
{
    EnvGuard g_rt("PARCELLINK_RECEIPT_TIMEOUT_MS");
    EnvGuard g_ip("PARCELLINK_INTER_PARCEL_MS");
    EnvGuard g_cmp("PARCELLINK_COMPRESSION");
    g_rt.set("2500");
    g_ip.set("0");
    g_cmp.set("off");

    auto cfg = engine::config_from_env();
    EXPECT_EQ(cfg.receipt_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.inter_parcel_delay, std::chrono::milliseconds(0));
    EXPECT_FALSE(cfg.compression_enabled);
    // untouched values keep their defaults
    EXPECT_EQ(cfg.retention, std::chrono::milliseconds(120000));
    EXPECT_EQ(cfg.listen_window, std::chrono::milliseconds(200));
}

TEST(Env_Config, InvalidValuesIgnored)
{
    EnvGuard g_rt("PARCELLINK_RECEIPT_TIMEOUT_MS");
    EnvGuard g_ret("PARCELLINK_RETENTION_MS");
    EnvGuard g_cmp("PARCELLINK_COMPRESSION");
    g_rt.set("soon");
    g_ret.set("5");  // below the 1 s floor
    g_cmp.set("maybe");

    testing::internal::CaptureStderr();
    auto        cfg = engine::config_from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.receipt_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(cfg.retention, std::chrono::milliseconds(120000));
    EXPECT_TRUE(cfg.compression_enabled);
    EXPECT_NE(err.find("PARCELLINK_RECEIPT_TIMEOUT_MS"), std::string::npos);
}
