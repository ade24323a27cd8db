/// @file WorkItem.cpp
/// @brief Tests for Warden::Execution::WorkItem.

#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Execution/WorkItem.hpp>

#include <catch2/catch_test_macros.hpp>
#include <memory>

TEST_CASE("WorkItem executes an inline lambda job", "[Execution][WorkItem]")
{
    int  value = 0;
    auto item  = Warden::Execution::WorkItem([&]() noexcept { value = 42; });
    CHECK_FALSE(item.IsEmpty());
    item.Invoke();
    REQUIRE(value == 42);
}

TEST_CASE("WorkItem accepts move-only jobs", "[Execution][WorkItem]")
{
    auto payload = std::make_unique<int>(7);
    int  seen    = 0;

    Warden::Execution::WorkItem item([p = std::move(payload), &seen]() { seen = *p; });
    Warden::Execution::WorkItem moved = std::move(item);
    moved.Invoke();

    CHECK(seen == 7);
}

TEST_CASE("WorkItem Reset destroys the job without running it", "[Execution][WorkItem]")
{
    bool                  ran = false;
    std::shared_ptr<int>  token = std::make_shared<int>(0);
    std::weak_ptr<int>    watch = token;

    Warden::Execution::WorkItem item([t = std::move(token), &ran]() { ran = true; });
    item.Reset();

    CHECK(item.IsEmpty());
    CHECK(watch.expired());
    item.Invoke();
    CHECK_FALSE(ran);
}

TEST_CASE("WorkItem rejects an empty job", "[Execution][WorkItem]")
{
    Warden::Execution::WorkItem::Job empty;
    REQUIRE_THROWS_AS(Warden::Execution::WorkItem(std::move(empty)), Warden::Exceptions::NullArgumentException);
}
