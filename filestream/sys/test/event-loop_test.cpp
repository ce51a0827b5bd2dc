#include "filestream/event-loop.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <chrono>

#include "filestream/base-fd.hpp"
#include "filestream/event.hpp"

namespace filestream {

class EventLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::array<int, 2> fds{};
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds.data()), 0);
    lhs = BaseFd(fds[0]);
    rhs = BaseFd(fds[1]);
  }

  EventLoop loop{std::chrono::milliseconds{10}, 1};
  BaseFd lhs;
  BaseFd rhs;
};

TEST_F(EventLoopTest, TimeoutReturnsEmpty) {
  ASSERT_TRUE(loop.add({lhs.fd(), EventIn}));
  EXPECT_TRUE(loop.poll().empty());
}

TEST_F(EventLoopTest, ReadableEvent) {
  ASSERT_TRUE(loop.add({lhs.fd(), EventIn}));
  ASSERT_EQ(::write(rhs.fd(), "x", 1), 1);
  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, lhs.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
}

TEST_F(EventLoopTest, ModSwitchesInterest) {
  ASSERT_TRUE(loop.add({lhs.fd(), EventIn}));
  EXPECT_TRUE(loop.poll().empty());
  ASSERT_TRUE(loop.mod({lhs.fd(), EventIn | EventOut}));
  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_NE(events[0].eventBmp & EventOut, 0U);
}

TEST_F(EventLoopTest, CapacityGrowsWhenSaturated) {
  ASSERT_TRUE(loop.add({lhs.fd(), EventOut}));
  ASSERT_TRUE(loop.add({rhs.fd(), EventOut}));
  EXPECT_EQ(loop.capacity(), 1U);
  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  loop.del(rhs.fd());
  EXPECT_EQ(loop.poll().size(), 1U);
}

TEST_F(EventLoopTest, ModOfUnknownFdFails) { EXPECT_FALSE(loop.mod({lhs.fd(), EventIn})); }

}  // namespace filestream
