#include <rl/common/bounded_queue.hpp>
#include <rl/common/test_entrypoint.hpp>

#include <thread>

namespace rl {

TEST(OverwritingQueueTest, CapacityOneKeepsNewest)
{
  OverwritingQueue<int> queue(1);
  EXPECT_EQ(queue.push(1), 0u);
  EXPECT_EQ(queue.push(2), 1u);
  EXPECT_EQ(queue.push(3), 1u);
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue.drops(), 2u);

  int value = 0;
  ASSERT_TRUE(queue.tryPop(&value));
  EXPECT_EQ(value, 3);
  EXPECT_FALSE(queue.tryPop(&value));
}

TEST(OverwritingQueueTest, DropsOldestInOrder)
{
  OverwritingQueue<int> queue(4);
  for (int i = 0; i < 6; ++i)
  {
    queue.push(i);
  }
  EXPECT_EQ(queue.drops(), 2u);
  int value = -1;
  for (int expected = 2; expected < 6; ++expected)
  {
    ASSERT_TRUE(queue.tryPop(&value));
    EXPECT_EQ(value, expected);
  }
}

TEST(OverwritingQueueTest, PopForTimesOutWhenEmpty)
{
  OverwritingQueue<int> queue(2);
  int value = 0;
  EXPECT_FALSE(queue.popFor(&value, std::chrono::milliseconds(5)));
}

TEST(OverwritingQueueTest, CloseWakesWaiter)
{
  OverwritingQueue<int> queue(2);
  std::thread closer([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.close();
  });
  int value = 0;
  EXPECT_FALSE(queue.popFor(&value, std::chrono::seconds(5)));
  closer.join();
  EXPECT_EQ(queue.push(1), 0u);
  EXPECT_EQ(queue.size(), 0u);
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
