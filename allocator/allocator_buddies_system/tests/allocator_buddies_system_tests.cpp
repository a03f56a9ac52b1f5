#include <gtest/gtest.h>
#include <allocator_buddies_system.h>
#include <random>
#include <string>
#include <vector>

namespace {

using block_info = allocator_test_utils::block_info;

void expect_partition_is_valid(allocator_buddies_system const &allocator)
{
    auto const blocks = allocator.get_blocks_info();
    ASSERT_FALSE(blocks.empty());

    size_t expected_start = 0;
    for (auto const &b : blocks)
    {
        EXPECT_EQ(b.start, expected_start) << "gap or overlap before block at " << b.start;
        EXPECT_TRUE(allocator_buddies_system::is_power_of_two(b.block_size));
        EXPECT_GE(b.block_size, allocator.min_block_size());
        EXPECT_EQ(b.start % b.block_size, 0u) << "block at " << b.start << " is not aligned to its size";
        EXPECT_EQ(b.is_block_occupied, !b.owner.empty());
        expected_start = b.start + b.block_size;
    }
    EXPECT_EQ(expected_start, allocator.capacity());

    for (size_t i = 0; i + 1 < blocks.size(); ++i)
    {
        auto const &left = blocks[i];
        auto const &right = blocks[i + 1];
        bool const are_buddies = left.block_size == right.block_size && (left.start ^ left.block_size) == right.start;
        EXPECT_FALSE(are_buddies && !left.is_block_occupied && !right.is_block_occupied)
            << "free buddies at " << left.start << " and " << right.start << " were not merged";
    }

    EXPECT_EQ(allocator.total_allocated() + allocator.total_free() + allocator.internal_fragmentation(),
              allocator.capacity());
}

}

TEST(allocatorBuddiesSystemPositiveTests, test1)
{
    allocator_buddies_system allocator(128, 1);

    auto result = allocator.allocate("A", 30);

    EXPECT_EQ(result.handle.start, 0u);
    EXPECT_EQ(result.handle.size, 32u);
    EXPECT_EQ(allocator.internal_fragmentation(), 2u);
    EXPECT_EQ(allocator.total_allocated(), 30u);
    EXPECT_EQ(allocator.total_free(), 96u);

    std::vector<block_info> expected = {
        {0, 32, true, "A", 30},
        {32, 32, false, "", 0},
        {64, 64, false, "", 0}
    };
    EXPECT_EQ(allocator.get_blocks_info(), expected);
    EXPECT_EQ(result.diff.after, expected);
    expect_partition_is_valid(allocator);
}

TEST(allocatorBuddiesSystemPositiveTests, test2)
{
    allocator_buddies_system allocator(64);

    auto a = allocator.allocate("A", 16);
    auto b = allocator.allocate("B", 16);
    EXPECT_EQ(a.handle, (allocator_buddies_system::block_handle{0, 16}));
    EXPECT_EQ(b.handle, (allocator_buddies_system::block_handle{16, 16}));

    allocator.deallocate(a.handle);
    expect_partition_is_valid(allocator);
    allocator.deallocate(b.handle);

    std::vector<block_info> expected = {{0, 64, false, "", 0}};
    EXPECT_EQ(allocator.get_blocks_info(), expected);
}

TEST(allocatorBuddiesSystemPositiveTests, test3)
{
    allocator_buddies_system allocator(16);

    allocator.allocate("A", 10);
    auto before = allocator.get_blocks_info();

    EXPECT_THROW(allocator.allocate("B", 1), out_of_memory);
    EXPECT_EQ(allocator.get_blocks_info(), before);
    ASSERT_EQ(before.size(), 1u);
    EXPECT_EQ(before[0].owner, "A");
    EXPECT_EQ(before[0].block_size, 16u);
}

TEST(allocatorBuddiesSystemPositiveTests, test4)
{
    allocator_buddies_system allocator(8);

    allocator.allocate("A", 4);
    auto before = allocator.get_blocks_info();

    EXPECT_THROW(allocator.set_capacity(4), capacity_change_denied);
    EXPECT_EQ(allocator.capacity(), 8u);
    EXPECT_EQ(allocator.get_blocks_info(), before);
}

TEST(allocatorBuddiesSystemPositiveTests, test5)
{
    for (size_t capacity : {1u, 2u, 16u, 1024u})
    {
        allocator_buddies_system allocator(capacity);
        auto before = allocator.get_blocks_info();

        try
        {
            allocator.allocate("A", 0);
            FAIL() << "zero-sized request was accepted";
        }
        catch (buddy_system_error const &e)
        {
            EXPECT_EQ(e.kind(), buddy_system_error::error_kind::invalid_request);
        }
        EXPECT_EQ(allocator.get_blocks_info(), before);
    }
}

TEST(allocatorBuddiesSystemPositiveTests, test6)
{
    allocator_buddies_system allocator(256, 4);
    allocator.allocate("A", 100);
    auto before = allocator.get_blocks_info();

    auto result = allocator.allocate("B", 3);
    EXPECT_EQ(result.handle.size, 4u);
    EXPECT_EQ(result.diff.before, before);

    allocator.deallocate(result.handle);
    EXPECT_EQ(allocator.get_blocks_info(), before);
}

TEST(allocatorBuddiesSystemPositiveTests, test7)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 5);

    auto first = allocator.get_blocks_info();
    auto second = allocator.get_blocks_info();
    EXPECT_EQ(first, second);
}

TEST(allocatorBuddiesSystemPositiveTests, test8)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 8);
    allocator.allocate("B", 16);
    allocator.allocate("C", 8);

    // Свободен только блок [32, 64), а [8, 16) отдан C
    auto d = allocator.allocate("D", 8);
    EXPECT_EQ(d.handle.start, 32u);

    allocator.deallocate(std::string("C"));
    auto e = allocator.allocate("E", 8);
    EXPECT_EQ(e.handle.start, 8u);
    expect_partition_is_valid(allocator);
}

TEST(allocatorBuddiesSystemPositiveTests, test9)
{
    allocator_buddies_system allocator(32);
    allocator.allocate("A", 8);
    allocator.allocate("B", 8);

    auto diff = allocator.set_capacity(100);
    EXPECT_EQ(diff.old_capacity, 32u);
    EXPECT_EQ(diff.new_capacity, 128u);
    EXPECT_EQ(allocator.capacity(), 128u);

    std::vector<block_info> expected = {
        {0, 8, true, "A", 8},
        {8, 8, true, "B", 8},
        {16, 16, false, "", 0},
        {32, 32, false, "", 0},
        {64, 64, false, "", 0}
    };
    EXPECT_EQ(allocator.get_blocks_info(), expected);
    expect_partition_is_valid(allocator);

    allocator.deallocate(std::string("A"));
    allocator.deallocate(std::string("B"));
    EXPECT_EQ(allocator.get_blocks_info(), (std::vector<block_info>{{0, 128, false, "", 0}}));
}

TEST(allocatorBuddiesSystemPositiveTests, test10)
{
    allocator_buddies_system allocator(64);

    auto diff = allocator.set_capacity(20);
    EXPECT_EQ(allocator.capacity(), 32u);
    EXPECT_TRUE(diff.changed());
    EXPECT_EQ(allocator.get_blocks_info(), (std::vector<block_info>{{0, 32, false, "", 0}}));

    auto same = allocator.set_capacity(32);
    EXPECT_FALSE(same.changed());
}

TEST(allocatorBuddiesSystemPositiveTests, test11)
{
    allocator_buddies_system allocator(128);
    allocator.allocate("A", 30);

    auto found = allocator.find_by_owner("A");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->start, 0u);
    EXPECT_EQ(found->block_size, 32u);
    EXPECT_EQ(found->requested_size, 30u);

    EXPECT_FALSE(allocator.find_by_owner("B").has_value());
}

TEST(allocatorBuddiesSystemPositiveTests, test12)
{
    allocator_buddies_system allocator(64);
    auto a = allocator.allocate("A", 16);

    EXPECT_EQ(a.diff.removed(), (std::vector<block_info>{{0, 64, false, "", 0}}));
    EXPECT_EQ(a.diff.added().size(), 3u);

    auto freed = allocator.deallocate(a.handle);
    EXPECT_EQ(freed.added(), (std::vector<block_info>{{0, 64, false, "", 0}}));
    EXPECT_EQ(freed.removed().size(), 3u);
}

TEST(allocatorBuddiesSystemPositiveTests, test13)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 16);
    allocator.allocate("B", 3);

    auto diff = allocator.reset();
    EXPECT_TRUE(diff.changed());
    EXPECT_EQ(allocator.allocated_block_count(), 0u);
    EXPECT_EQ(allocator.get_blocks_info(), (std::vector<block_info>{{0, 64, false, "", 0}}));
}

TEST(allocatorBuddiesSystemPositiveTests, test14)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 4);

    EXPECT_EQ(allocator.largest_free_block(), 32u);
    EXPECT_EQ(allocator.free_block_count(), 4u);
    EXPECT_EQ(allocator.allocated_block_count(), 1u);
    EXPECT_EQ(allocator.depth_of(64), 0u);
    EXPECT_EQ(allocator.depth_of(4), 4u);
    EXPECT_THROW(allocator.depth_of(3), invalid_request);
}

TEST(allocatorBuddiesSystemPositiveTests, test15)
{
    std::mt19937 engine(20241017);
    std::uniform_int_distribution<size_t> size_dist(1, 40);
    std::uniform_int_distribution<int> action_dist(0, 2);

    allocator_buddies_system allocator(256, 2);
    std::vector<std::string> owners;

    for (int step = 0; step < 2000; ++step)
    {
        if (action_dist(engine) != 0 || owners.empty())
        {
            std::string owner = "P" + std::to_string(step);
            try
            {
                allocator.allocate(owner, size_dist(engine));
                owners.push_back(owner);
            }
            catch (out_of_memory const &)
            {

            }
        }
        else
        {
            std::uniform_int_distribution<size_t> index_dist(0, owners.size() - 1);
            size_t index = index_dist(engine);
            allocator.deallocate(owners[index]);
            owners.erase(owners.begin() + static_cast<std::ptrdiff_t>(index));
        }

        expect_partition_is_valid(allocator);
    }

    for (auto const &owner : owners)
    {
        allocator.deallocate(owner);
    }
    EXPECT_EQ(allocator.get_blocks_info(), (std::vector<block_info>{{0, 256, false, "", 0}}));
}

TEST(allocatorBuddiesSystemNegativeTests, test1)
{
    EXPECT_THROW(allocator_buddies_system(0), invalid_request);
    EXPECT_THROW(allocator_buddies_system(64, 0), invalid_request);
    EXPECT_THROW(allocator_buddies_system(64, 3), invalid_request);
}

TEST(allocatorBuddiesSystemNegativeTests, test2)
{
    allocator_buddies_system allocator(64);
    auto a = allocator.allocate("A", 8);
    auto before = allocator.get_blocks_info();

    EXPECT_THROW(allocator.deallocate((allocator_buddies_system::block_handle{8, 8})), unknown_allocation);
    EXPECT_THROW(allocator.deallocate((allocator_buddies_system::block_handle{0, 16})), unknown_allocation);
    EXPECT_THROW(allocator.deallocate(std::string("B")), unknown_allocation);
    EXPECT_EQ(allocator.get_blocks_info(), before);

    allocator.deallocate(a.handle);
    EXPECT_THROW(allocator.deallocate(a.handle), unknown_allocation);
}

TEST(allocatorBuddiesSystemNegativeTests, test3)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 8);
    auto before = allocator.get_blocks_info();

    EXPECT_THROW(allocator.allocate("A", 8), invalid_request);
    EXPECT_THROW(allocator.allocate("", 8), invalid_request);
    EXPECT_THROW(allocator.allocate("B", 65), out_of_memory);
    EXPECT_THROW(allocator.allocate("B", static_cast<size_t>(-1)), out_of_memory);
    EXPECT_THROW(allocator.set_capacity(0), invalid_request);
    EXPECT_THROW(allocator.set_capacity(static_cast<size_t>(-1)), invalid_request);
    EXPECT_EQ(allocator.get_blocks_info(), before);
}

TEST(allocatorBuddiesSystemNegativeTests, test4)
{
    allocator_buddies_system allocator(64);
    allocator.allocate("A", 32);
    allocator.allocate("B", 16);
    auto before = allocator.get_blocks_info();

    // Свободно 16, но одним блоком 32 не набрать
    EXPECT_THROW(allocator.allocate("C", 17), out_of_memory);
    EXPECT_EQ(allocator.get_blocks_info(), before);
}

int main(
    int argc,
    char **argv)
{
    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
