#include "sandbox_config.hh"

#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <unistd.h>
#include <vector>

using jailer::TerminationCause;

// NOLINTNEXTLINE
TEST(sandbox, concurrent_executions_share_a_config) {
    auto config = std::make_shared<const jailer::ConfigModel>(make_config(host_options()));
    std::vector<std::future<Result<jailer::ExecutionResult, jailer::PlanError>>> futures;
    constexpr int executions = 8;
    for (int i = 0; i < executions; ++i) {
        futures.emplace_back(
            jailer::execute_async(config, sh(concat_tostr("sleep 0.1; exit ", i)))
        );
    }
    for (int i = 0; i < executions; ++i) {
        auto res = futures[i].get();
        ASSERT_TRUE(res.is_ok());
        EXPECT_EQ(res.ok().cause, TerminationCause::COMPLETED) << res.ok().description();
        EXPECT_EQ(res.ok().exit_code, i);
    }
}

// NOLINTNEXTLINE
TEST(sandbox, time_limits_of_concurrent_executions_are_independent) {
    auto limited_opts = host_options();
    limited_opts.timing.wall_time_limit = std::chrono::milliseconds{100};
    auto limited = std::make_shared<const jailer::ConfigModel>(make_config(limited_opts));
    auto unlimited = std::make_shared<const jailer::ConfigModel>(make_config(host_options()));

    auto slow = jailer::execute_async(limited, sh("exec sleep 10"));
    auto quick = jailer::execute_async(unlimited, sh("sleep 0.3; exit 0"));
    auto slow_res = slow.get();
    auto quick_res = quick.get();
    ASSERT_TRUE(slow_res.is_ok());
    ASSERT_TRUE(quick_res.is_ok());
    EXPECT_EQ(slow_res.ok().cause, TerminationCause::TIMED_OUT);
    EXPECT_EQ(quick_res.ok().cause, TerminationCause::COMPLETED);
    EXPECT_EQ(quick_res.ok().exit_code, 0);
}

// NOLINTNEXTLINE
TEST(sandbox, concurrent_executions_in_user_namespaces) {
    auto ns = no_namespaces();
    ns.user = true;
    SKIP_IF_NAMESPACES_UNAVAILABLE(ns);

    constexpr int executions = 8;
    std::vector<std::future<Result<jailer::ExecutionResult, jailer::PlanError>>> futures;
    for (int i = 0; i < executions; ++i) {
        auto opts = host_options();
        opts.namespaces = ns;
        opts.identity = {.uid = static_cast<uid_t>(1000 + i), .gid = 0};
        opts.timing.wall_time_limit = std::chrono::seconds{10};
        futures.emplace_back(jailer::execute_async(
            std::make_shared<const jailer::ConfigModel>(make_config(std::move(opts))),
            sh(concat_tostr("test \"$(id -u)\" = ", 1000 + i))
        ));
    }
    for (auto& future : futures) {
        auto res = future.get();
        ASSERT_TRUE(res.is_ok());
        EXPECT_EQ(res.ok().cause, TerminationCause::COMPLETED) << res.ok().description();
        EXPECT_EQ(res.ok().exit_code, 0) << res.ok().description();
    }
}

// NOLINTNEXTLINE
TEST(sandbox, concurrent_executions_have_private_roots) {
    auto ns = no_namespaces();
    ns.user = true;
    ns.mount = true;
    SKIP_IF_NAMESPACES_UNAVAILABLE(ns);

    auto opts = host_options();
    opts.namespaces = ns;
    opts.filesystem.mounts = system_binds();
    // The same destination in every execution
    opts.filesystem.mounts.push_back({
        .kind = jailer::MountSpec::Kind::TMPFS,
        .source = {},
        .dest = "/scratch",
        .fs_type = {},
        .options = "size=1m",
        .read_only = false,
    });
    opts.timing.wall_time_limit = std::chrono::seconds{10};
    auto config = std::make_shared<const jailer::ConfigModel>(make_config(std::move(opts)));

    constexpr int executions = 4;
    std::vector<std::future<Result<jailer::ExecutionResult, jailer::PlanError>>> futures;
    for (int i = 0; i < executions; ++i) {
        futures.emplace_back(jailer::execute_async(
            config,
            sh(concat_tostr(
                "test ! -e /scratch/id && echo ",
                i,
                " > /scratch/id && sleep 0.2 && test \"$(cat /scratch/id)\" = ",
                i
            ))
        ));
    }
    for (auto& future : futures) {
        auto res = future.get();
        ASSERT_TRUE(res.is_ok());
        EXPECT_EQ(res.ok().cause, TerminationCause::COMPLETED) << res.ok().description();
        EXPECT_EQ(res.ok().exit_code, 0) << res.ok().description();
    }
    EXPECT_NE(access("/scratch/id", F_OK), 0);
}
