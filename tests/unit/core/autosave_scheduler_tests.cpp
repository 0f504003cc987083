#include <gtest/gtest.h>

#include "markdd/core/autosave_scheduler.hpp"

#include <chrono>

using markdd::core::AutosaveScheduler;
using namespace std::chrono_literals;

TEST(AutosaveScheduler, DisabledByDefault)
{
    AutosaveScheduler scheduler;
    auto now = AutosaveScheduler::Clock::now();
    scheduler.onDocumentChanged(true, true, now);
    EXPECT_FALSE(scheduler.pending());
    EXPECT_FALSE(scheduler.due(now + 1h));
}

TEST(AutosaveScheduler, SchedulesModifiedDocumentsWithAFile)
{
    AutosaveScheduler scheduler(true, 30s);
    auto now = AutosaveScheduler::Clock::now();
    scheduler.onDocumentChanged(true, true, now);
    EXPECT_TRUE(scheduler.pending());
    EXPECT_FALSE(scheduler.due(now + 29s));
    EXPECT_TRUE(scheduler.due(now + 30s));
}

TEST(AutosaveScheduler, EachChangeRestartsTheInterval)
{
    AutosaveScheduler scheduler(true, 10s);
    auto now = AutosaveScheduler::Clock::now();
    scheduler.onDocumentChanged(true, true, now);
    scheduler.onDocumentChanged(true, true, now + 8s);
    EXPECT_FALSE(scheduler.due(now + 12s));
    EXPECT_TRUE(scheduler.due(now + 18s));
}

TEST(AutosaveScheduler, UntitledOrCleanDocumentsAreNotScheduled)
{
    AutosaveScheduler scheduler(true, 10s);
    auto now = AutosaveScheduler::Clock::now();
    scheduler.onDocumentChanged(false, true, now);
    EXPECT_FALSE(scheduler.pending());

    scheduler.onDocumentChanged(true, true, now);
    scheduler.onDocumentChanged(true, false, now);
    EXPECT_FALSE(scheduler.pending());
}

TEST(AutosaveScheduler, FailedSavesAreRetriedAfterAnInterval)
{
    AutosaveScheduler scheduler(true, 10s);
    auto now = AutosaveScheduler::Clock::now();
    scheduler.onDocumentChanged(true, true, now);
    scheduler.onSaveResult(false, now + 10s);
    EXPECT_FALSE(scheduler.due(now + 15s));
    EXPECT_TRUE(scheduler.due(now + 20s));

    scheduler.onSaveResult(true, now + 20s);
    EXPECT_FALSE(scheduler.pending());
}
