#include <gtest/gtest.h>
#include <core/shutdown_registry.hpp>
#include <string>
#include <vector>

TEST(ShutdownRegistryTest, DrainRunsLastAddedFirst) {
    std::vector<int> order;
    ShutdownRegistry reg("test");
    reg.add([&] { order.push_back(1); });
    reg.add([&] { order.push_back(2); });
    reg.add([&] { order.push_back(3); });
    EXPECT_EQ(reg.pending(), 3u);

    reg.drain();
    EXPECT_EQ(order, (std::vector<int>{3, 2, 1}));
    EXPECT_TRUE(reg.drained());
    EXPECT_EQ(reg.pending(), 0u);
}

TEST(ShutdownRegistryTest, DrainRunsOnlyOnce) {
    int runs = 0;
    ShutdownRegistry reg("test");
    reg.add([&] { runs++; });
    reg.drain();
    reg.drain();
    EXPECT_EQ(runs, 1);
}

TEST(ShutdownRegistryTest, AddAfterDrainRunsImmediately) {
    int runs = 0;
    ShutdownRegistry reg("test");
    reg.drain();
    reg.add([&] { runs++; });
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(reg.pending(), 0u);
}

TEST(ShutdownRegistryTest, DestructorDrains) {
    int runs = 0;
    {
        ShutdownRegistry reg("scoped");
        reg.add([&] { runs++; });
        EXPECT_EQ(runs, 0);
    }
    EXPECT_EQ(runs, 1);
}

TEST(ShutdownRegistryTest, EmptyActionIgnored) {
    ShutdownRegistry reg("test");
    reg.add(nullptr);
    EXPECT_EQ(reg.pending(), 0u);
    EXPECT_EQ(reg.name(), "test");
}
