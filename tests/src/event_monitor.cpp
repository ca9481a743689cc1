#include "unit-tests.hpp"

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace wcc;
using namespace wcc::tests;

namespace
{
    events::Event makeEvent(const events::Topic & signature, std::uint64_t block_number)
    {
        events::Event event;
        event.address = *chain::parseAddress("0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
        event.topics = {signature};
        event.block_number = block_number;
        return event;
    }
}

TEST_F(UnitTest, EventMonitor_SubscribeAssignsSequentialIds)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context);

    const auto first = monitor.subscribe(events::EventFilter{});
    const auto second = monitor.subscribe(events::EventFilter{});

    EXPECT_EQ(first->getId(), "sub_1");
    EXPECT_EQ(second->getId(), "sub_2");
    EXPECT_EQ(monitor.getSubscriptionCount(), 2u);
    EXPECT_TRUE(first->isActive());
    EXPECT_EQ(first->getCapacity(), events::DEFAULT_MAILBOX_CAPACITY);
}

TEST_F(UnitTest, EventMonitor_DeliversOnlyMatchingEvents)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context);

    events::EventFilter transfers;
    transfers.addTopic(events::transferTopic());

    const auto transfer_sub = monitor.subscribe(transfers);
    const auto all_sub = monitor.subscribe(events::EventFilter{});

    EXPECT_EQ(monitor.processEvent(makeEvent(events::transferTopic(), 1)), 2u);
    EXPECT_EQ(monitor.processEvent(makeEvent(events::approvalTopic(), 2)), 1u);

    EXPECT_EQ(transfer_sub->size(), 1u);
    EXPECT_EQ(all_sub->size(), 2u);

    const auto polled = all_sub->poll();
    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(polled->block_number, 1u);

    const auto rest = all_sub->drain();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].block_number, 2u);
    EXPECT_FALSE(all_sub->poll().has_value());
}

TEST_F(UnitTest, EventMonitor_FullMailboxDropsNewEvents)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context, 2);

    const auto subscription = monitor.subscribe(events::EventFilter{});
    for(std::uint64_t block = 1; block <= 5; ++block)
    {
        monitor.processEvent(makeEvent(events::transferTopic(), block));
    }

    EXPECT_EQ(subscription->size(), 2u);
    EXPECT_EQ(subscription->getDroppedCount(), 3u);

    const auto kept = subscription->drain();
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].block_number, 1u);
    EXPECT_EQ(kept[1].block_number, 2u);

    EXPECT_EQ(monitor.processEvent(makeEvent(events::transferTopic(), 6)), 1u);
}

TEST_F(UnitTest, EventMonitor_UnsubscribeStopsDelivery)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context);

    const auto subscription = monitor.subscribe(events::EventFilter{});
    monitor.processEvent(makeEvent(events::transferTopic(), 1));

    EXPECT_TRUE(monitor.unsubscribe(subscription->getId()));
    EXPECT_FALSE(monitor.unsubscribe(subscription->getId()));
    EXPECT_FALSE(monitor.unsubscribe("sub_999"));
    EXPECT_EQ(monitor.getSubscriptionCount(), 0u);

    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(monitor.processEvent(makeEvent(events::transferTopic(), 2)), 0u);
    EXPECT_FALSE(subscription->offer(makeEvent(events::transferTopic(), 3)));

    // buffered events survive the stop
    ASSERT_EQ(subscription->size(), 1u);
    EXPECT_EQ(subscription->poll()->block_number, 1u);
}

TEST_F(UnitTest, EventMonitor_HandlersRunOnIoContext)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context);

    std::vector<std::uint64_t> transfer_blocks;
    std::size_t approval_calls = 0;

    monitor.addEventHandler(events::transferTopic(), [&](const events::Event & event)
    {
        transfer_blocks.push_back(event.block_number);
    });
    monitor.addEventHandler(events::approvalTopic(), [&](const events::Event &)
    {
        ++approval_calls;
    });

    monitor.processEvent(makeEvent(events::transferTopic(), 7));
    monitor.processEvent(makeEvent(events::transferTopic(), 8));
    monitor.processEvent(events::Event{});

    EXPECT_TRUE(transfer_blocks.empty());

    io_context.run();

    EXPECT_EQ(transfer_blocks, (std::vector<std::uint64_t>{7, 8}));
    EXPECT_EQ(approval_calls, 0u);
}

TEST_F(UnitTest, EventMonitor_FailingHandlerDoesNotStopOthers)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context);

    std::size_t calls = 0;
    monitor.addEventHandler(events::transferTopic(), [](const events::Event &)
    {
        throw std::runtime_error("handler failure");
    });
    monitor.addEventHandler(events::transferTopic(), [&](const events::Event &)
    {
        ++calls;
    });

    monitor.processEvent(makeEvent(events::transferTopic(), 1));
    EXPECT_NO_THROW(io_context.run());
    EXPECT_EQ(calls, 1u);
}

TEST_F(UnitTest, EventMonitor_ConcurrentProducers)
{
    asio::io_context io_context;
    events::EventMonitor monitor(io_context, 1000);

    const auto subscription = monitor.subscribe(events::EventFilter{});

    std::vector<std::thread> producers;
    for(int t = 0; t < 4; ++t)
    {
        producers.emplace_back([&monitor, t]()
        {
            for(std::uint64_t i = 0; i < 100; ++i)
            {
                monitor.processEvent(makeEvent(events::transferTopic(), t * 100 + i));
            }
        });
    }

    for(auto & producer : producers)
    {
        producer.join();
    }

    EXPECT_EQ(subscription->size(), 400u);
    EXPECT_EQ(subscription->getDroppedCount(), 0u);
}
