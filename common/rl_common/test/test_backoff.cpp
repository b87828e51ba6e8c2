#include <rl/common/backoff.hpp>
#include <rl/common/test_entrypoint.hpp>

namespace rl {

TEST(ExponentialBackoffTest, DoublesUntilCap)
{
  ExponentialBackoff backoff(500, 5000);
  EXPECT_EQ(backoff.nextDelayMs(), 500);
  EXPECT_EQ(backoff.nextDelayMs(), 1000);
  EXPECT_EQ(backoff.nextDelayMs(), 2000);
  EXPECT_EQ(backoff.nextDelayMs(), 4000);
  EXPECT_EQ(backoff.nextDelayMs(), 5000);
  EXPECT_EQ(backoff.nextDelayMs(), 5000);
  EXPECT_EQ(backoff.attempts(), 6);
}

TEST(ExponentialBackoffTest, SessionReconnectSchedule)
{
  ExponentialBackoff backoff(1000, 30000);
  const int64_t expected[] = {1000, 2000, 4000, 8000, 16000, 30000, 30000};
  for (const int64_t delay : expected)
  {
    EXPECT_EQ(backoff.nextDelayMs(), delay);
  }
}

TEST(ExponentialBackoffTest, ResetStartsOver)
{
  ExponentialBackoff backoff(100, 2000);
  backoff.nextDelayMs();
  backoff.nextDelayMs();
  EXPECT_EQ(backoff.peekDelayMs(), 400);
  backoff.reset();
  EXPECT_EQ(backoff.attempts(), 0);
  EXPECT_EQ(backoff.nextDelayMs(), 100);
}

TEST(ExponentialBackoffTest, CapBelowBaseIsRaised)
{
  ExponentialBackoff backoff(800, 200);
  EXPECT_EQ(backoff.capMs(), 800);
  EXPECT_EQ(backoff.nextDelayMs(), 800);
  EXPECT_EQ(backoff.nextDelayMs(), 800);
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
