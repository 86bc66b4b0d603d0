#include <gtest/gtest.h>

#include "../recon/Cancellation.hpp"

#include <thread>

using namespace net_recon::recon;

TEST(Cancellation, DefaultTokenNeverFires)
{
    CancelToken token;
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_FALSE(token.WaitFor(std::chrono::milliseconds(10)));
}

TEST(Cancellation, WaitWakesOnCancel)
{
    CancelSource source;
    CancelToken token = source.Token();

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.Cancel();
    });

    EXPECT_TRUE(token.WaitFor(std::chrono::seconds(5)));
    EXPECT_TRUE(token.IsCancelled());
    canceller.join();

    source.Cancel();
    EXPECT_TRUE(source.IsCancelled());
}

TEST(Cancellation, ChildFollowsParent)
{
    CancelSource parent;
    CancelSource child(parent.Token());
    CancelSource sibling(parent.Token());

    child.Cancel();
    EXPECT_FALSE(parent.IsCancelled());
    EXPECT_FALSE(sibling.IsCancelled());

    parent.Cancel();
    EXPECT_TRUE(sibling.IsCancelled());
}

TEST(Cancellation, FollowingCancelledTokenCancelsImmediately)
{
    CancelSource done;
    done.Cancel();

    CancelSource late;
    late.Follow(done.Token());
    EXPECT_TRUE(late.IsCancelled());

    CancelSource child(done.Token());
    EXPECT_TRUE(child.Token().IsCancelled());
}

TEST(Cancellation, FollowsSeveralSources)
{
    CancelSource request;
    CancelSource shutdown;
    CancelSource job(request.Token());
    job.Follow(shutdown.Token());

    shutdown.Cancel();
    EXPECT_TRUE(job.IsCancelled());
    EXPECT_FALSE(request.IsCancelled());
}
