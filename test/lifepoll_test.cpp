// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "lifepoll.h"
#include "util.h"
#include <gtest/gtest.h>

TEST(LifePoll, QuietWithoutLimitOrInterrupt) {
   lifepoll poller ;
   for (int i=0; i<100; i++)
      EXPECT_EQ(0, poller.poll()) ;
   EXPECT_EQ(0, poller.isInterrupted()) ;
   EXPECT_EQ(0, poller.isTimedOut()) ;
}

TEST(LifePoll, SetInterruptedIsSeenImmediately) {
   lifepoll poller ;
   poller.setdeadline(lifeSecondCount() + 1000) ;
   EXPECT_EQ(0, poller.poll()) ;
   poller.setInterrupted() ;
   EXPECT_EQ(1, poller.poll()) ;
   EXPECT_EQ(1, poller.isInterrupted()) ;
   EXPECT_EQ(0, poller.isTimedOut()) ;
}

TEST(LifePoll, PassedDeadlineStopsAndSticks) {
   lifepoll poller ;
   poller.setdeadline(lifeSecondCount() - 1) ;
   EXPECT_EQ(1, poller.poll()) ;
   EXPECT_EQ(1, poller.isTimedOut()) ;
   // moving the deadline does not undo the stop
   poller.setdeadline(lifeSecondCount() + 1000) ;
   EXPECT_EQ(1, poller.poll()) ;
   poller.resetInterrupted() ;
   EXPECT_EQ(0, poller.poll()) ;
   EXPECT_EQ(0, poller.isTimedOut()) ;
}

TEST(LifePoll, TimeLimitIsRelativeToNow) {
   lifepoll poller ;
   double before = lifeSecondCount() ;
   poller.settimelimit(60) ;
   EXPECT_GE(poller.getdeadline(), before + 60) ;
   EXPECT_EQ(0, poller.poll()) ;
   poller.settimelimit(0) ;
   EXPECT_EQ(0.0, poller.getdeadline()) ;
   poller.settimelimit(-5) ;
   EXPECT_EQ(0.0, poller.getdeadline()) ;
   EXPECT_EQ(0, poller.poll()) ;
}
