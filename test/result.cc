#include <gtest/gtest.h>
#include <jailer/result.hh>
#include <memory>
#include <string>

static_assert(Result<void, char>{Ok{}}.is_ok());
static_assert(!Result<void, char>{Err{'a'}}.is_ok());

static_assert(Result<void, char>{Err{'a'}}.is_err());
static_assert(!Result<void, char>{Ok{}}.is_err());

static_assert(Result<int, char>{Ok{42}}.ok() == 42);
static_assert(Result<int, char>{Err{'x'}}.err() == 'x');

// NOLINTNEXTLINE
TEST(result, unwrap_moves_the_value) {
    Result<std::unique_ptr<int>, std::string> res = Ok{std::make_unique<int>(7)};
    ASSERT_TRUE(res.is_ok());
    auto ptr = std::move(res).unwrap();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 7);
}

// NOLINTNEXTLINE
TEST(result, unwrap_err_moves_the_error) {
    Result<int, std::unique_ptr<std::string>> res = Err{std::make_unique<std::string>("bad")};
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(*res.err(), "bad");
    auto err = std::move(res).unwrap_err();
    EXPECT_EQ(*err, "bad");
}

// NOLINTNEXTLINE
TEST(result, void_alternatives) {
    Result<void, std::string> res = Ok{};
    EXPECT_TRUE(res.is_ok());
    res = Err{std::string{"failed"}};
    EXPECT_EQ(res.err(), "failed");
}
