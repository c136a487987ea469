#include <gtest/gtest.h>
#include <vector>
#include "RecencyList.hpp"

namespace {

using List = RecencyList<int>;

std::vector<int> mru_to_lru(const List& l) {
    std::vector<int> out;
    for (auto h = l.front(); h != List::npos; h = l.less_recent(h)) out.push_back(l[h]);
    return out;
}

std::vector<int> lru_to_mru(const List& l) {
    std::vector<int> out;
    for (auto h = l.back(); h != List::npos; h = l.more_recent(h)) out.push_back(l[h]);
    return out;
}

}  // namespace

TEST(RecencyListTest, EmptyListHasNoEnds) {
    List l;
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.front(), List::npos);
    EXPECT_EQ(l.back(), List::npos);
    EXPECT_FALSE(l.pop_back().has_value());
}

TEST(RecencyListTest, EmplaceFrontPutsNewestFirst) {
    List l;
    l.emplace_front(1);
    l.emplace_front(2);
    l.emplace_front(3);
    EXPECT_EQ(l.size(), 3u);
    EXPECT_EQ(mru_to_lru(l), (std::vector<int>{3, 2, 1}));
    EXPECT_EQ(lru_to_mru(l), (std::vector<int>{1, 2, 3}));
}

TEST(RecencyListTest, SingleElementIsBothEnds) {
    List l;
    auto h = l.emplace_front(7);
    EXPECT_EQ(l.front(), h);
    EXPECT_EQ(l.back(), h);
    l.move_to_front(h);
    EXPECT_EQ(l.front(), h);
    EXPECT_EQ(l.pop_back(), 7);
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.front(), List::npos);
}

TEST(RecencyListTest, MoveToFrontReorders) {
    List l;
    auto a = l.emplace_front(1);
    l.emplace_front(2);
    l.emplace_front(3);
    l.move_to_front(a);
    EXPECT_EQ(mru_to_lru(l), (std::vector<int>{1, 3, 2}));
    EXPECT_EQ(l.size(), 3u);
}

TEST(RecencyListTest, PopBackTakesLeastRecent) {
    List l;
    l.emplace_front(1);
    l.emplace_front(2);
    EXPECT_EQ(l.pop_back(), 1);
    EXPECT_EQ(l.pop_back(), 2);
    EXPECT_FALSE(l.pop_back().has_value());
}

TEST(RecencyListTest, EraseMiddleRelinksNeighbours) {
    List l;
    l.emplace_front(1);
    auto mid = l.emplace_front(2);
    l.emplace_front(3);
    EXPECT_EQ(l.erase(mid), 2);
    EXPECT_EQ(mru_to_lru(l), (std::vector<int>{3, 1}));
    EXPECT_EQ(lru_to_mru(l), (std::vector<int>{1, 3}));
}

TEST(RecencyListTest, FreedSlotIsReused) {
    List l;
    l.emplace_front(1);
    auto h = l.emplace_front(2);
    l.erase(h);
    EXPECT_EQ(l.emplace_front(5), h);
    EXPECT_EQ(l[h], 5);
    EXPECT_EQ(mru_to_lru(l), (std::vector<int>{5, 1}));
}

TEST(RecencyListTest, ClearLeavesUsableEmptyList) {
    List l;
    for (int i = 0; i < 10; ++i) l.emplace_front(i);
    l.clear();
    EXPECT_TRUE(l.empty());
    EXPECT_EQ(l.front(), List::npos);
    EXPECT_EQ(l.back(), List::npos);
    l.emplace_front(42);
    EXPECT_EQ(mru_to_lru(l), (std::vector<int>{42}));
}
