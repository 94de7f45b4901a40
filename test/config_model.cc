#include <cerrno>
#include <chrono>
#include <climits>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <jailer/config_model.hh>
#include <string>
#include <sys/resource.h>

using jailer::ConfigError;
using jailer::ConfigModel;
using jailer::LimitPolicy;
using jailer::MountSpec;
using Options = jailer::ConfigModel::Options;

namespace {

ConfigError expect_invalid(Options opts) {
    auto res = ConfigModel::create(std::move(opts));
    EXPECT_TRUE(res.is_err());
    if (res.is_ok()) {
        return {};
    }
    return std::move(res).unwrap_err();
}

MountSpec bind(std::string source, std::string dest, bool read_only = true) {
    return {
        .kind = MountSpec::Kind::BIND,
        .source = std::move(source),
        .dest = std::move(dest),
        .fs_type = {},
        .options = {},
        .read_only = read_only,
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(config_model, defaults_are_valid) {
    auto res = ConfigModel::create(Options{});
    ASSERT_TRUE(res.is_ok()) << res.err().description();
    const auto& config = res.ok();
    EXPECT_TRUE(config.namespaces().user);
    EXPECT_TRUE(config.namespaces().mount);
    EXPECT_FALSE(config.namespaces().time);
    EXPECT_TRUE(config.filesystem().proc.enabled);
    EXPECT_EQ(config.working_dir(), "/");
    EXPECT_EQ(config.hostname(), "jailer");
    EXPECT_TRUE(config.security().no_new_privs);
    EXPECT_EQ(config.timing().wall_time_limit, std::nullopt);
}

// NOLINTNEXTLINE
TEST(config_model, validate_is_pure) {
    Options opts;
    opts.working_dir = "relative";
    opts.hostname = "";
    auto first = ConfigModel::validate(opts);
    auto second = ConfigModel::validate(opts);
    EXPECT_EQ(first.size(), 2U);
    EXPECT_EQ(first, second);
}

// NOLINTNEXTLINE
TEST(config_model, all_violations_are_reported) {
    Options opts;
    opts.working_dir = "/a/../b";
    opts.filesystem.mounts.emplace_back(bind("usr", "/usr"));
    opts.timing.wall_time_limit = std::chrono::nanoseconds{0};
    opts.security.nice_level = 20;
    auto err = expect_invalid(std::move(opts));
    EXPECT_TRUE(err.mentions("working_dir"));
    EXPECT_TRUE(err.mentions("filesystem.mounts"));
    EXPECT_TRUE(err.mentions("filesystem"));
    EXPECT_TRUE(err.mentions("timing.wall_time_limit"));
    EXPECT_TRUE(err.mentions("security.nice_level"));
    EXPECT_FALSE(err.mentions("hostname"));
    EXPECT_FALSE(err.mentions("filesystem.mount"));
    EXPECT_EQ(err.violations.size(), 4U);
    EXPECT_THAT(err.description(), testing::HasSubstr("security.nice_level: has to lie in range"));
}

// NOLINTNEXTLINE
TEST(config_model, mount_destinations) {
    Options opts;
    opts.filesystem.mounts.emplace_back(bind("/usr", "/"));
    opts.filesystem.mounts.emplace_back(bind("/usr", "usr"));
    opts.filesystem.mounts.emplace_back(bind("/usr", "/x/../../etc"));
    opts.filesystem.mounts.emplace_back(bind("/usr", "/usr"));
    auto err = expect_invalid(std::move(opts));
    EXPECT_TRUE(err.mentions("filesystem.mounts[0]"));
    EXPECT_TRUE(err.mentions("filesystem.mounts[1]"));
    EXPECT_TRUE(err.mentions("filesystem.mounts[2]"));
    EXPECT_FALSE(err.mentions("filesystem.mounts[3]"));
}

// NOLINTNEXTLINE
TEST(config_model, mount_kinds) {
    Options opts;
    opts.filesystem.mounts.push_back({
        .kind = MountSpec::Kind::TMPFS,
        .source = "/tmp",
        .dest = "/tmp",
        .fs_type = {},
        .options = {},
        .read_only = false,
    });
    opts.filesystem.mounts.push_back({
        .kind = MountSpec::Kind::OTHER,
        .source = "none",
        .dest = "/mnt",
        .fs_type = {},
        .options = {},
        .read_only = false,
    });
    auto err = expect_invalid(std::move(opts));
    EXPECT_THAT(
        err.violations,
        testing::ElementsAre(
            ConfigError::Violation{"filesystem.mounts[0]", "tmpfs mount cannot have a source"},
            ConfigError::Violation{"filesystem.mounts[1]", "filesystem type is required"}
        )
    );
}

// NOLINTNEXTLINE
TEST(config_model, filesystem_requires_mount_namespace) {
    Options opts;
    opts.namespaces.mount = false;
    opts.filesystem.root.source = "/";
    opts.filesystem.mounts.emplace_back(bind("/usr", "/usr"));
    opts.filesystem.symlinks.push_back({.source = "usr/bin", .dest = "/bin"});
    opts.filesystem.proc.path = "/my_proc";
    auto err = expect_invalid(std::move(opts));
    EXPECT_TRUE(err.mentions("filesystem.root"));
    EXPECT_TRUE(err.mentions("filesystem.mounts[0]"));
    EXPECT_TRUE(err.mentions("filesystem.symlinks[0]"));
    EXPECT_TRUE(err.mentions("filesystem.proc"));

    // The default proc settings are fine, proc is just not mounted then
    Options fine;
    fine.namespaces.mount = false;
    EXPECT_TRUE(ConfigModel::create(std::move(fine)).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, limits) {
    Options opts;
    opts.limits.cpu_time = uint64_t{RLIM_INFINITY};
    opts.limits.open_files = LimitPolicy::UNBOUNDED;
    opts.limits.memory = LimitPolicy::CURRENT_MAX;
    opts.limits.stack_size = uint64_t{8 << 20};
    auto err = expect_invalid(std::move(opts));
    EXPECT_TRUE(err.mentions("limits.cpu_time"));
    EXPECT_TRUE(err.mentions("limits.open_files"));
    EXPECT_FALSE(err.mentions("limits.memory"));
    EXPECT_FALSE(err.mentions("limits.stack_size"));
}

// NOLINTNEXTLINE
TEST(config_model, additional_limits) {
    Options opts;
    opts.limits.locked_memory = uint64_t{RLIM_INFINITY};
    opts.limits.realtime_priority = uint64_t{0};
    opts.limits.message_queue = LimitPolicy::CURRENT_SOFT;
    auto err = expect_invalid(opts);
    ASSERT_EQ(err.violations.size(), 1U);
    EXPECT_EQ(err.violations[0].field, "limits.locked_memory");

    opts.limits.locked_memory = uint64_t{64 << 10};
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
    // Ignored limits are still validated
    opts.limits.disabled = true;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, durations_are_bounded) {
    constexpr auto max_duration = jailer::Timing::max_duration;
    Options opts;
    opts.timing.wall_time_limit = max_duration + std::chrono::nanoseconds{1};
    opts.timing.grace_period = std::chrono::hours{24 * 366};
    opts.timing.preparation_timeout = std::chrono::nanoseconds::max();
    auto err = expect_invalid(opts);
    EXPECT_THAT(
        err.violations,
        testing::ElementsAre(
            ConfigError::Violation{"timing.wall_time_limit", "cannot exceed 31536000 s"},
            ConfigError::Violation{"timing.grace_period", "cannot exceed 31536000 s"},
            ConfigError::Violation{"timing.preparation_timeout", "cannot exceed 31536000 s"}
        )
    );

    opts.timing.wall_time_limit = max_duration;
    opts.timing.grace_period = max_duration;
    opts.timing.preparation_timeout = std::chrono::seconds{0};
    err = expect_invalid(opts);
    EXPECT_THAT(
        err.violations,
        testing::ElementsAre(
            ConfigError::Violation{"timing.preparation_timeout", "has to be positive"}
        )
    );

    opts.timing.preparation_timeout = std::chrono::milliseconds{1};
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, open_files_above_nr_open) {
    Options opts;
    opts.limits.open_files = uint64_t{1} << 40;
    auto err = expect_invalid(std::move(opts));
    EXPECT_TRUE(err.mentions("limits.open_files"));
}

// NOLINTNEXTLINE
TEST(config_model, cgroup) {
    Options opts;
    opts.cgroup.memory_max = 1 << 20;
    EXPECT_TRUE(expect_invalid(opts).mentions("cgroup.parent"));

    opts.cgroup.parent = "relative/path";
    opts.cgroup.cpu_ms_per_sec = 0;
    opts.cgroup.pids_max = 0;
    auto err = expect_invalid(opts);
    EXPECT_TRUE(err.mentions("cgroup.parent"));
    EXPECT_TRUE(err.mentions("cgroup.cpu_ms_per_sec"));
    EXPECT_TRUE(err.mentions("cgroup.pids_max"));

    opts.cgroup.parent = "/sys/fs/cgroup/jailer";
    opts.cgroup.cpu_ms_per_sec = 500;
    opts.cgroup.pids_max = 16;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, hostname) {
    Options opts;
    opts.hostname = std::string(HOST_NAME_MAX + 1, 'x');
    EXPECT_TRUE(expect_invalid(opts).mentions("hostname"));

    opts.hostname = "box";
    opts.namespaces.uts = false;
    EXPECT_TRUE(expect_invalid(opts).mentions("hostname"));

    opts.namespaces.uts = true;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, environment) {
    Options opts;
    opts.environment.inherit_all = true;
    opts.environment.allow = {"PATH"};
    EXPECT_TRUE(expect_invalid(opts).mentions("environment.allow"));

    opts.environment.inherit_all = false;
    opts.environment.allow = {"A=B"};
    opts.environment.overrides = {{"", "x"}};
    auto err = expect_invalid(opts);
    EXPECT_TRUE(err.mentions("environment.allow"));
    EXPECT_TRUE(err.mentions("environment.overrides"));
}

// NOLINTNEXTLINE
TEST(config_model, capabilities) {
    Options opts;
    opts.capabilities.retain = {"cap_net_raw", "cap_no_such_thing"};
    auto err = expect_invalid(opts);
    ASSERT_EQ(err.violations.size(), 1U);
    EXPECT_EQ(err.violations[0].message, "unknown capability: cap_no_such_thing");

    opts.capabilities.retain = {"cap_net_raw"};
    opts.capabilities.keep_all = true;
    EXPECT_TRUE(expect_invalid(opts).mentions("capabilities"));

    opts.capabilities.keep_all = false;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, max_cpus) {
    Options opts;
    opts.security.max_cpus = 0;
    EXPECT_TRUE(expect_invalid(opts).mentions("security.max_cpus"));

    opts.security.max_cpus = 1;
    opts.security.disable_tsc = true;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}

// NOLINTNEXTLINE
TEST(config_model, seccomp) {
    Options opts;
    opts.security.seccomp = jailer::SeccompPolicy{
        .mode = jailer::SeccompPolicy::Mode::DENY_LISTED,
        .syscalls = {"ptrace", "no_such_syscall"},
        .errno_value = 0,
        .log = false,
    };
    auto err = expect_invalid(opts);
    EXPECT_THAT(
        err.violations,
        testing::UnorderedElementsAre(
            ConfigError::Violation{"security.seccomp", "unknown syscall: no_such_syscall"},
            ConfigError::Violation{"security.seccomp", "errno value has to lie in range [1, 4095]"}
        )
    );

    opts.security.seccomp->syscalls = {"ptrace"};
    opts.security.seccomp->errno_value = EPERM;
    EXPECT_TRUE(ConfigModel::create(opts).is_ok());
}
