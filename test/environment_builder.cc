#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <jailer/environment_builder.hh>
#include <sched.h>
#include <stdexcept>
#include <string>
#include <sys/resource.h>
#include <unistd.h>
#include <vector>

using jailer::build_plan;
using jailer::ConfigModel;
using jailer::EnvironmentPlan;
using jailer::LimitPolicy;
using jailer::MountSpec;
using jailer::PlanStage;
using Options = jailer::ConfigModel::Options;
namespace plan = jailer::plan;
using std::string;
using std::vector;

namespace {

ConfigModel make_config(Options opts) {
    auto res = ConfigModel::create(std::move(opts));
    if (res.is_err()) {
        throw std::runtime_error(res.err().description());
    }
    return std::move(res).unwrap();
}

EnvironmentPlan plan_ok(Options opts) {
    auto res = build_plan(make_config(std::move(opts)));
    if (res.is_err()) {
        throw std::runtime_error(res.err().description());
    }
    return std::move(res).unwrap();
}

jailer::PlanError plan_err(Options opts) {
    auto res = build_plan(make_config(std::move(opts)));
    if (res.is_ok()) {
        throw std::runtime_error("expected the plan to fail");
    }
    return std::move(res).unwrap_err();
}

MountSpec mount(MountSpec::Kind kind, string source, string dest, bool read_only) {
    return {
        .kind = kind,
        .source = std::move(source),
        .dest = std::move(dest),
        .fs_type = kind == MountSpec::Kind::OTHER ? "tmpfs" : "",
        .options = {},
        .read_only = read_only,
    };
}

vector<string> descriptions(const EnvironmentPlan& env_plan) {
    vector<string> res;
    for (const auto& action : env_plan.actions) {
        res.emplace_back(jailer::describe(action));
    }
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(environment_builder, default_plan) {
    auto env_plan = plan_ok(Options{});

    const auto* ns = env_plan.find<plan::CreateNamespaces>();
    ASSERT_NE(ns, nullptr);
    for (auto flag : {CLONE_NEWNET, CLONE_NEWUSER, CLONE_NEWNS, CLONE_NEWPID, CLONE_NEWIPC,
                      CLONE_NEWUTS, CLONE_NEWCGROUP})
    {
        EXPECT_TRUE(ns->clone_flags & flag) << flag;
    }
    EXPECT_FALSE(ns->clone_flags & CLONE_NEWTIME);

    ASSERT_NE(env_plan.find<plan::SetHostname>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::SetHostname>()->hostname, "jailer");
    EXPECT_NE(env_plan.find<plan::BringUpLoopback>(), nullptr);

    const auto* root = env_plan.find<plan::EstablishRoot>();
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->source, std::nullopt);
    EXPECT_TRUE(root->read_only);

    const auto* proc = env_plan.find<plan::MountProc>();
    ASSERT_NE(proc, nullptr);
    EXPECT_EQ(proc->path, "/proc");
    EXPECT_TRUE(proc->read_only);

    const auto* identity = env_plan.find<plan::SetIdentity>();
    ASSERT_NE(identity, nullptr);
    EXPECT_EQ(identity->uid, geteuid());
    EXPECT_EQ(identity->gid, getegid());
    EXPECT_TRUE(identity->via_user_namespace);

    EXPECT_NE(env_plan.find<plan::EnterNewSession>(), nullptr);
    const auto* caps = env_plan.find<plan::DropCapabilities>();
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(caps->retained.empty());
    EXPECT_FALSE(caps->keep_all);
    EXPECT_TRUE(caps->no_new_privs);

    EXPECT_EQ(env_plan.find<plan::ApplyResourceLimits>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::InstallSeccompFilter>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::SetNiceLevel>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, actions_are_ordered_by_stage) {
    Options opts;
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::TMPFS, "", "/tmp", false));
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::BIND, "/usr", "/usr", true));
    opts.filesystem.symlinks.push_back({.source = "usr/bin", .dest = "/bin"});
    opts.limits.core_size = uint64_t{0};
    opts.security.nice_level = 5;
    opts.security.seccomp = jailer::SeccompPolicy{};
    auto env_plan = plan_ok(std::move(opts));

    vector<PlanStage> stages;
    for (const auto& action : env_plan.actions) {
        stages.emplace_back(jailer::stage_of(action));
    }
    EXPECT_TRUE(std::is_sorted(stages.begin(), stages.end()));
    EXPECT_EQ(stages.front(), PlanStage::NAMESPACES);
    EXPECT_EQ(stages.back(), PlanStage::PRIVILEGES);
    EXPECT_NE(env_plan.find<plan::InstallSeccompFilter>(), nullptr);
    EXPECT_NE(env_plan.find<plan::SetNiceLevel>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, read_only_binds_come_first) {
    Options opts;
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::OTHER, "none", "/a", false));
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::TMPFS, "", "/b", false));
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::BIND, "/tmp", "/c", false));
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::BIND, "/usr", "/d", true));
    auto env_plan = plan_ok(std::move(opts));

    vector<string> mounts;
    for (const auto& desc : descriptions(env_plan)) {
        if (desc.starts_with("bind_mount") or desc.starts_with("mount")) {
            mounts.emplace_back(desc);
        }
    }
    EXPECT_THAT(
        mounts,
        testing::ElementsAre(
            "bind_mount /usr -> /d (ro)",
            "bind_mount /tmp -> /c (rw)",
            "mount_tmpfs /b (rw)",
            "mount tmpfs none -> /a (rw)",
            "mount_proc /proc (ro)"
        )
    );
}

// NOLINTNEXTLINE
TEST(environment_builder, missing_sources_are_reported) {
    Options opts;
    opts.filesystem.root.source = "/nonexistent/root";
    opts.filesystem.mounts.emplace_back(
        mount(MountSpec::Kind::BIND, "/nonexistent/source", "/x", true)
    );
    auto err = plan_err(std::move(opts));
    EXPECT_THAT(
        err.problems,
        testing::ElementsAre(
            "root source is not an existing directory: /nonexistent/root",
            "bind mount source does not exist: /nonexistent/source"
        )
    );
    EXPECT_THAT(err.description(), testing::HasSubstr("/nonexistent/source\n"));
}

// NOLINTNEXTLINE
TEST(environment_builder, host_root_is_not_modified) {
    Options opts;
    opts.filesystem.root.source = "/";
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::TMPFS, "", "/tmp", false));
    opts.filesystem.mounts.emplace_back(
        mount(MountSpec::Kind::TMPFS, "", "/nonexistent-mount-point", false)
    );
    opts.filesystem.symlinks.push_back({.source = "usr/bin", .dest = "/nonexistent-link"});
    auto err = plan_err(opts);
    EXPECT_THAT(
        err.problems,
        testing::UnorderedElementsAre(
            "mount point does not exist in the root source: /nonexistent-mount-point",
            "symlink cannot be created inside the root source: /nonexistent-link"
        )
    );

    opts.filesystem.mounts.pop_back();
    opts.filesystem.symlinks.clear();
    auto env_plan = plan_ok(opts);
    EXPECT_NE(env_plan.find<plan::MountTmpfs>(), nullptr);
    EXPECT_NE(env_plan.find<plan::MountProc>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, writable_mount_shadowing_read_only_bind) {
    Options opts;
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::BIND, "/usr", "/data", true));
    opts.filesystem.mounts.emplace_back(mount(MountSpec::Kind::TMPFS, "", "/data", false));
    auto err = plan_err(std::move(opts));
    EXPECT_THAT(
        err.problems,
        testing::ElementsAre("writable mount would shadow the read-only bind mount at /data")
    );
}

// NOLINTNEXTLINE
TEST(environment_builder, proc_in_user_namespace_requires_pid_namespace) {
    Options opts;
    opts.namespaces.pid = false;
    auto err = plan_err(opts);
    EXPECT_THAT(err.problems, testing::ElementsAre(testing::HasSubstr("PID namespace")));

    opts.filesystem.proc.enabled = false;
    auto env_plan = plan_ok(opts);
    EXPECT_EQ(env_plan.find<plan::MountProc>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, without_mount_namespace) {
    Options opts;
    opts.namespaces = {
        .net = false,
        .user = false,
        .mount = false,
        .pid = false,
        .ipc = false,
        .uts = false,
        .cgroup = false,
        .time = false,
    };
    auto env_plan = plan_ok(opts);
    EXPECT_EQ(env_plan.find<plan::CreateNamespaces>()->clone_flags, 0U);
    EXPECT_EQ(env_plan.find<plan::EstablishRoot>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::MountProc>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::SetHostname>(), nullptr);
    EXPECT_EQ(env_plan.find<plan::BringUpLoopback>(), nullptr);
    EXPECT_FALSE(env_plan.find<plan::SetIdentity>()->via_user_namespace);
}

// NOLINTNEXTLINE
TEST(environment_builder, changing_identity_without_user_namespace) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root may change its identity";
    }
    Options opts;
    opts.namespaces.user = false;
    opts.identity.uid = geteuid() + 1;
    auto err = plan_err(opts);
    EXPECT_THAT(err.problems, testing::ElementsAre(testing::HasSubstr("requires root")));
}

// NOLINTNEXTLINE
TEST(environment_builder, environment) {
    ASSERT_EQ(setenv("JAILER_TEST_ALLOWED", "allowed", 1), 0);
    ASSERT_EQ(setenv("JAILER_TEST_HIDDEN", "hidden", 1), 0);
    ASSERT_EQ(unsetenv("JAILER_TEST_UNSET"), 0);

    Options opts;
    opts.environment.allow = {"JAILER_TEST_ALLOWED", "JAILER_TEST_UNSET"};
    opts.environment.overrides = {{"A", "1"}, {"B", "2"}, {"A", "3"}};
    auto env_plan = plan_ok(opts);
    const auto* env = env_plan.find<plan::SetEnvironment>();
    ASSERT_NE(env, nullptr);
    EXPECT_THAT(env->vars, testing::ElementsAre("JAILER_TEST_ALLOWED=allowed", "A=3", "B=2"));

    opts.environment.allow.clear();
    opts.environment.inherit_all = true;
    opts.environment.overrides = {{"JAILER_TEST_HIDDEN", "overridden"}};
    env_plan = plan_ok(opts);
    env = env_plan.find<plan::SetEnvironment>();
    ASSERT_NE(env, nullptr);
    EXPECT_THAT(env->vars, testing::Contains("JAILER_TEST_ALLOWED=allowed"));
    EXPECT_THAT(env->vars, testing::Contains("JAILER_TEST_HIDDEN=overridden"));
    EXPECT_THAT(env->vars, testing::Not(testing::Contains("JAILER_TEST_HIDDEN=hidden")));
}

// NOLINTNEXTLINE
TEST(environment_builder, resource_limits) {
    struct rlimit fsize = {};
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &fsize), 0);

    Options opts;
    opts.limits.cpu_time = uint64_t{3};
    opts.limits.file_size = LimitPolicy::CURRENT_SOFT;
    opts.limits.core_size = LimitPolicy::CURRENT_MAX;
    auto env_plan = plan_ok(opts);
    const auto* limits = env_plan.find<plan::ApplyResourceLimits>();
    ASSERT_NE(limits, nullptr);
    ASSERT_EQ(limits->limits.size(), 3U);

    EXPECT_EQ(limits->limits[0].resource, RLIMIT_CPU);
    EXPECT_EQ(limits->limits[0].soft, 3U);
    EXPECT_GE(limits->limits[0].hard, 3U);
    EXPECT_LE(limits->limits[0].hard, 4U);

    EXPECT_EQ(limits->limits[1].resource, RLIMIT_FSIZE);
    EXPECT_EQ(limits->limits[1].soft, fsize.rlim_cur);
    EXPECT_EQ(limits->limits[1].hard, fsize.rlim_cur);

    EXPECT_EQ(limits->limits[2].resource, RLIMIT_CORE);
}

// NOLINTNEXTLINE
TEST(environment_builder, additional_resource_limits) {
    Options opts;
    opts.limits.locked_memory = uint64_t{0};
    opts.limits.realtime_priority = uint64_t{0};
    opts.limits.message_queue = uint64_t{0};
    auto env_plan = plan_ok(opts);
    const auto* limits = env_plan.find<plan::ApplyResourceLimits>();
    ASSERT_NE(limits, nullptr);
    vector<int> resources;
    for (const auto& limit : limits->limits) {
        resources.emplace_back(limit.resource);
        EXPECT_EQ(limit.soft, 0U);
        EXPECT_EQ(limit.hard, 0U);
    }
    EXPECT_THAT(
        resources,
        testing::UnorderedElementsAre(RLIMIT_MEMLOCK, RLIMIT_RTPRIO, RLIMIT_MSGQUEUE)
    );
}

// NOLINTNEXTLINE
TEST(environment_builder, disabled_resource_limits) {
    Options opts;
    opts.limits.cpu_time = uint64_t{3};
    opts.limits.process_count = LimitPolicy::UNBOUNDED;
    opts.limits.disabled = true;
    auto env_plan = plan_ok(opts);
    EXPECT_EQ(env_plan.find<plan::ApplyResourceLimits>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, cpu_affinity_and_tsc) {
    cpu_set_t allowed;
    CPU_ZERO(&allowed);
    ASSERT_EQ(sched_getaffinity(0, sizeof(allowed), &allowed), 0);

    Options opts;
    opts.security.max_cpus = 1;
    opts.security.disable_tsc = true;
    auto env_plan = plan_ok(opts);
    const auto* affinity = env_plan.find<plan::SetCpuAffinity>();
    ASSERT_NE(affinity, nullptr);
    ASSERT_EQ(affinity->cpus.size(), 1U);
    EXPECT_TRUE(CPU_ISSET(affinity->cpus[0], &allowed));
    EXPECT_EQ(jailer::stage_of(*affinity), PlanStage::PRIVILEGES);
    EXPECT_NE(env_plan.find<plan::DisableTsc>(), nullptr);

    // More CPUs than available means all of them
    opts.security.max_cpus = 1 << 20;
    opts.security.disable_tsc = false;
    env_plan = plan_ok(opts);
    affinity = env_plan.find<plan::SetCpuAffinity>();
    ASSERT_NE(affinity, nullptr);
    EXPECT_EQ(affinity->cpus.size(), static_cast<size_t>(CPU_COUNT(&allowed)));
    EXPECT_EQ(env_plan.find<plan::DisableTsc>(), nullptr);

    EXPECT_EQ(plan_ok(Options{}).find<plan::SetCpuAffinity>(), nullptr);
}

// NOLINTNEXTLINE
TEST(environment_builder, raising_a_hard_limit_requires_privileges) {
    struct rlimit nproc = {};
    ASSERT_EQ(getrlimit(RLIMIT_NPROC, &nproc), 0);
    if (geteuid() == 0 or nproc.rlim_max == RLIM_INFINITY) {
        GTEST_SKIP() << "the hard limit can be raised or is already unbounded";
    }
    Options opts;
    opts.limits.process_count = LimitPolicy::UNBOUNDED;
    auto err = plan_err(opts);
    EXPECT_THAT(
        err.problems, testing::ElementsAre(testing::HasSubstr("limit process_count exceeds"))
    );
}

// NOLINTNEXTLINE
TEST(environment_builder, plan_carries_timing_and_cgroup) {
    Options opts;
    opts.timing.wall_time_limit = std::chrono::milliseconds{1500};
    opts.timing.grace_period = std::chrono::milliseconds{100};
    opts.cgroup.parent = "/sys/fs/cgroup/jailer";
    opts.cgroup.pids_max = 8;
    auto env_plan = plan_ok(opts);
    EXPECT_EQ(env_plan.timing.wall_time_limit, std::chrono::milliseconds{1500});
    EXPECT_EQ(env_plan.timing.grace_period, std::chrono::milliseconds{100});
    EXPECT_EQ(env_plan.cgroup.parent, "/sys/fs/cgroup/jailer");
    EXPECT_EQ(env_plan.cgroup.pids_max, 8U);
}

// NOLINTNEXTLINE
TEST(environment_builder, describe) {
    EXPECT_EQ(
        jailer::describe(plan::BindMount{.source = "/usr", .dest = "/usr", .read_only = true}),
        "bind_mount /usr -> /usr (ro)"
    );
    EXPECT_EQ(
        jailer::describe(plan::EstablishRoot{.source = std::nullopt, .read_only = false}),
        "establish_root tmpfs (rw)"
    );
    EXPECT_EQ(
        jailer::describe(plan::CreateSymlink{.target = "usr/bin", .link_path = "/bin"}),
        "create_symlink /bin -> usr/bin"
    );
    EXPECT_EQ(
        jailer::describe(plan::SetIdentity{.uid = 1000, .gid = 100, .via_user_namespace = true}),
        "set_identity uid=1000 gid=100 (user namespace)"
    );
    EXPECT_EQ(
        jailer::describe(plan::DropCapabilities{
            .retained = {"cap_net_raw"}, .keep_all = false, .no_new_privs = true}),
        "drop_capabilities retained=1 no_new_privs"
    );
    EXPECT_EQ(jailer::describe(plan::SetCpuAffinity{.cpus = {0, 1}}), "set_cpu_affinity 0 1");
    EXPECT_EQ(jailer::describe(plan::DisableTsc{}), "disable_tsc");
}
