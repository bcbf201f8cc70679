#include <gtest/gtest.h>
#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace scrape;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<int, String> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorResult) {
    Result<int, String> result = make_error(String("error message"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "error message");
}

TEST(ResultTest, ValueOr) {
    Result<int, String> ok_result = 42;
    Result<int, String> err_result = make_error(String("error"));

    EXPECT_EQ(ok_result.value_or(0), 42);
    EXPECT_EQ(err_result.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int, String> result = 21;
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 42);
}

TEST(ResultTest, MapKeepsError) {
    Result<int, String> result = make_error(String("bad"));
    auto mapped = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "bad");
}

TEST(ResultTest, MapErr) {
    Result<int, String> result = make_error(String("bad"));
    auto mapped = result.map_err([](const String& e) { return e.size(); });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), 3u);
}

TEST(ResultTest, AndThenChains) {
    auto half = [](int x) -> Result<int, String> {
        if (x % 2 != 0) {
            return make_error(String("odd"));
        }
        return x / 2;
    };

    Result<int, String> even = 8;
    Result<int, String> odd = 7;

    EXPECT_EQ(even.and_then(half).value(), 4);
    EXPECT_EQ(odd.and_then(half).error(), "odd");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>, String> result = std::make_unique<int>(5);
    ASSERT_TRUE(result.is_ok());

    auto owned = std::move(result).value();
    EXPECT_EQ(*owned, 5);
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok_result;
    Result<void, String> err_result = make_error(String("error"));

    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "error");
}

// ============================================================================
// RefPtr Tests
// ============================================================================

namespace {

class Counted : public RefCounted {
public:
    explicit Counted(int* destroyed) : m_destroyed(destroyed) {}
    ~Counted() override { ++*m_destroyed; }

private:
    int* m_destroyed;
};

} // namespace

TEST(RefPtrTest, MakeRefOwnsObject) {
    int destroyed = 0;
    {
        auto ptr = make_ref<Counted>(&destroyed);
        EXPECT_TRUE(ptr);
        EXPECT_EQ(ptr->ref_count(), 1u);
    }
    EXPECT_EQ(destroyed, 1);
}

TEST(RefPtrTest, CopyAndMoveAdjustCount) {
    int destroyed = 0;
    auto first = make_ref<Counted>(&destroyed);
    {
        RefPtr<Counted> second = first;
        EXPECT_EQ(first->ref_count(), 2u);

        RefPtr<Counted> third = std::move(second);
        EXPECT_EQ(first->ref_count(), 2u);
        EXPECT_FALSE(second);
        EXPECT_TRUE(third == first);
    }
    EXPECT_EQ(first->ref_count(), 1u);
    EXPECT_EQ(destroyed, 0);

    first = nullptr;
    EXPECT_EQ(destroyed, 1);
}

TEST(RefPtrTest, ConvertsToConst) {
    int destroyed = 0;
    auto ptr = make_ref<Counted>(&destroyed);
    RefPtr<const Counted> view = ptr;

    EXPECT_EQ(view.get(), ptr.get());
    EXPECT_EQ(ptr->ref_count(), 2u);
}

TEST(RefPtrTest, SharedAcrossThreads) {
    int destroyed = 0;
    auto ptr = make_ref<Counted>(&destroyed);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([ptr] {
            for (int j = 0; j < 1000; ++j) {
                RefPtr<Counted> copy = ptr;
                (void)copy;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(ptr->ref_count(), 1u);
    EXPECT_EQ(destroyed, 0);
}
