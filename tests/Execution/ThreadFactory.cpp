/// @file ThreadFactory.cpp
/// @brief Tests for Warden::Execution::NamedThreadFactory.

#include <Warden/Exceptions/ArgumentException.hpp>
#include <Warden/Execution/ThisThread.hpp>
#include <Warden/Execution/ThreadFactory.hpp>

#include <catch2/catch_test_macros.hpp>
#include <string>

namespace Warden::Execution
{
    TEST_CASE("NamedThreadFactory numbers threads in creation order", "[Execution][ThreadFactory]")
    {
        NamedThreadFactory factory("unit");

        std::string first;
        std::string second;
        {
            Thread a = factory.NewThread([&first] { first = ThisThread::GetName(); });
            Thread b = factory.NewThread([&second] { second = ThisThread::GetName(); });
            CHECK(a.GetName().View() == "unit-1");
            CHECK(b.GetName().View() == "unit-2");
        }

        CHECK(first == "unit-1");
        CHECK(second == "unit-2");
        CHECK(factory.CreatedCount() == 2);
        CHECK(factory.GetPrefix() == "unit");
    }

    TEST_CASE("NamedThreadFactory rejects an empty prefix", "[Execution][ThreadFactory]")
    {
        CHECK_THROWS_AS(NamedThreadFactory(""), Exceptions::InvalidArgumentException);
    }
}// namespace Warden::Execution
