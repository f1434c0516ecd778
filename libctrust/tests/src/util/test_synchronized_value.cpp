// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <future>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "ctrust/util/synchronized_value.hpp"

namespace ctrust::util
{
    static_assert(Mutex<std::mutex>);
    static_assert(Mutex<std::shared_mutex>);
    static_assert(SharedMutex<std::shared_mutex>);
    static_assert(std::is_nothrow_move_constructible_v<
                  scoped_locked_ptr<std::vector<int>, std::mutex, false>>);
}

namespace
{
    TEST_CASE("synchronized_value basics")
    {
        ctrust::util::synchronized_value<std::map<std::string, int>, std::shared_mutex> values;
        values->emplace("a", 1);

        {
            auto synched = values.synchronize();
            synched->emplace("b", 2);
            REQUIRE(synched->size() == 2);
        }

        const auto copy = values.value();
        REQUIRE(copy.at("a") == 1);
        REQUIRE(copy.at("b") == 2);

        const auto sum = values.apply(
            [](const std::map<std::string, int>& m)
            {
                int total = 0;
                for (const auto& [k, v] : m)
                {
                    total += v;
                }
                return total;
            }
        );
        REQUIRE(sum == 3);

        auto other = values;
        other->clear();
        REQUIRE(values->size() == 2);
    }

    TEST_CASE("synchronized_value concurrent updates")
    {
        ctrust::util::synchronized_value<std::vector<int>> values;
        constexpr int task_count = 8;
        constexpr int push_count = 100;

        std::vector<std::future<void>> tasks;
        for (int t = 0; t < task_count; ++t)
        {
            tasks.push_back(std::async(
                std::launch::async,
                [&values]
                {
                    for (int i = 0; i < push_count; ++i)
                    {
                        values->push_back(i);
                    }
                }
            ));
        }
        for (auto& task : tasks)
        {
            task.get();
        }

        REQUIRE(values->size() == static_cast<std::size_t>(task_count * push_count));
    }
}
