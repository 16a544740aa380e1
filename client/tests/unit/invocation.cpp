
#include "../mocks.hpp"

#include <grid/client/call_id_sequence.hpp>
#include <grid/client/invocation.hpp>
#include <grid/common/exceptions.hpp>

#include <thread>

#include <gtest/gtest.h>

class InvocationTest : public ::testing::Test {
protected:
  static constexpr int BUDGET = 4;

  void SetUp() override
  {
    setup_mocks(lifecycle);
    setup_mocks(*connection, address);

    context.config.retry_wait_ms = 10;
    context.config.invocation_timeout_ms = 60 * 1000;
  }

  Address address{"10.0.0.1", 5701};
  std::shared_ptr<testing::NiceMock<MockConnection>> connection =
      std::make_shared<testing::NiceMock<MockConnection>>();

  testing::NiceMock<MockLifecycle> lifecycle;
  testing::StrictMock<MockInvocationService> service;
  FailFastCallIdSequence sequence{BUDGET};
  ManualScheduler scheduler;
  InlineExecutor executor;

  InvocationContext context{lifecycle, service, sequence, scheduler, executor, config::Invocation{}};
};

TEST_F(InvocationTest, InvokeAssignsCorrelationId)
{
  auto message = make_message();
  auto invocation = Invocation::create(context, message);

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);

  auto future = invocation->invoke();

  EXPECT_FALSE(future->is_done());
  EXPECT_EQ(invocation->correlation_id(), 1);
  EXPECT_EQ(message->correlation_id(), 1);
  EXPECT_EQ(sequence.concurrent_invocations(), 1);

  auto response = make_response();
  invocation->notify(response);

  ASSERT_TRUE(future->is_done());
  EXPECT_EQ(future->get(), response);
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, RoutesAccordingToBinding)
{
  {
    auto invocation = Invocation::create(context, make_message(), binding::BoundConnection{connection});
    EXPECT_CALL(service, invoke_on_connection(testing::_, testing::Eq(connection))).Times(1);
    invocation->invoke();
    EXPECT_TRUE(invocation->is_bound_to_single_connection());
  }

  {
    auto message = make_message();
    auto invocation = Invocation::create(context, message, binding::Partition{17});
    EXPECT_CALL(service, invoke_on_partition_owner(testing::_, 17)).Times(1);
    invocation->invoke();
    EXPECT_EQ(invocation->partition_id(), 17);
    EXPECT_EQ(message->partition_id(), 17);
  }

  {
    auto invocation = Invocation::create(context, make_message(), binding::Target{address});
    EXPECT_CALL(service, invoke_on_target(testing::_, address)).Times(1);
    invocation->invoke();
    EXPECT_EQ(invocation->partition_id(), ClientMessage::UNASSIGNED_PARTITION);
  }

  {
    auto invocation = Invocation::create(context, make_message());
    EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
    invocation->invoke();
    EXPECT_FALSE(invocation->is_bound_to_single_connection());
  }
}

TEST_F(InvocationTest, RequiresMessageAndConnection)
{
  EXPECT_THROW(Invocation::create(context, nullptr), grid::common::InvalidArgumentError);
  EXPECT_THROW(
      Invocation::create(context, make_message(), binding::BoundConnection{nullptr}),
      grid::common::InvalidArgumentError
  );
}

TEST_F(InvocationTest, OverloadIsThrownSynchronously)
{
  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(BUDGET);

  std::vector<InvocationPtr> pending;
  for (int i = 0; i < BUDGET; ++i) {
    pending.emplace_back(Invocation::create(context, make_message()));
    pending.back()->invoke();
  }

  auto rejected = Invocation::create(context, make_message());
  EXPECT_THROW(rejected->invoke(), OverloadError);

  // Not queued for retry and not completed.
  EXPECT_TRUE(scheduler.tasks.empty());
  EXPECT_FALSE(rejected->future()->is_done());
  EXPECT_EQ(sequence.concurrent_invocations(), BUDGET);

  // Completing one request frees a slot.
  pending.front()->notify(make_response());
  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  EXPECT_NO_THROW(rejected->invoke());
}

TEST_F(InvocationTest, UrgentInvocationBypassesBudget)
{
  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(BUDGET + 1);

  std::vector<InvocationPtr> pending;
  for (int i = 0; i < BUDGET; ++i) {
    pending.emplace_back(Invocation::create(context, make_message()));
    pending.back()->invoke();
  }

  auto heartbeat = Invocation::create(context, make_message());
  EXPECT_NO_THROW(heartbeat->invoke_urgent());
  EXPECT_TRUE(heartbeat->is_urgent());
  EXPECT_EQ(sequence.concurrent_invocations(), BUDGET + 1);

  heartbeat->notify(make_response());
  EXPECT_EQ(sequence.concurrent_invocations(), BUDGET);
}

TEST_F(InvocationTest, BoundConnectionTransportFailureIsTerminal)
{
  auto invocation = Invocation::create(context, make_message(), binding::BoundConnection{connection});

  EXPECT_CALL(service, invoke_on_connection(testing::_, testing::_))
      .WillOnce(testing::Throw(IOError("write failed")));

  auto future = invocation->invoke();

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), IOError);
  EXPECT_TRUE(scheduler.tasks.empty());
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, BoundConnectionRetriesOtherRetrySafeFailures)
{
  auto invocation = Invocation::create(context, make_message(), binding::BoundConnection{connection});

  EXPECT_CALL(service, invoke_on_connection(testing::_, testing::_)).Times(1);
  auto future = invocation->invoke();

  invocation->notify_exception(std::make_exception_ptr(InstanceNotActiveError("member stopping")));

  EXPECT_FALSE(future->is_done());
  EXPECT_EQ(scheduler.tasks.size(), 1);
}

TEST_F(InvocationTest, TransportFailureIsRetried)
{
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .WillOnce(testing::Throw(IOError("no connection")))
      .WillOnce(testing::Return());

  auto future = invocation->invoke();

  EXPECT_FALSE(future->is_done());
  ASSERT_EQ(scheduler.tasks.size(), 1);
  EXPECT_EQ(scheduler.tasks.front().second, std::chrono::milliseconds{10});
  EXPECT_EQ(sequence.concurrent_invocations(), 1);

  EXPECT_EQ(scheduler.run_pending(), 1);

  // Previous id was released before the new one was acquired.
  EXPECT_EQ(invocation->correlation_id(), 2);
  EXPECT_EQ(sequence.concurrent_invocations(), 1);

  invocation->notify(make_response());
  EXPECT_TRUE(future->is_done());
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, TargetNotActiveAndRetryableFailuresAreRetried)
{
  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(2);

  auto first = Invocation::create(context, make_message());
  first->invoke();
  first->notify_exception(std::make_exception_ptr(InstanceNotActiveError("stopping")));

  auto second = Invocation::create(context, make_message());
  second->invoke();
  second->notify_exception(std::make_exception_ptr(TargetNotMemberError("left the cluster")));

  EXPECT_EQ(scheduler.tasks.size(), 2);
  EXPECT_FALSE(first->future()->is_done());
  EXPECT_FALSE(second->future()->is_done());
}

TEST_F(InvocationTest, DeadlinePassedIsTerminal)
{
  context.config.invocation_timeout_ms = 1;
  auto invocation = Invocation::create(context, make_message());
  std::this_thread::sleep_for(std::chrono::milliseconds{5});

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .WillOnce(testing::Throw(IOError("no connection")));

  auto future = invocation->invoke();

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), IOError);
  EXPECT_TRUE(scheduler.tasks.empty());
}

TEST_F(InvocationTest, TargetDisconnectedDependsOnMessage)
{
  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(2);

  {
    auto invocation = Invocation::create(context, make_message(true));
    auto future = invocation->invoke();
    invocation->notify_exception(std::make_exception_ptr(TargetDisconnectedError("closed")));

    EXPECT_FALSE(future->is_done());
    EXPECT_EQ(scheduler.tasks.size(), 1);
  }

  scheduler.tasks.clear();

  {
    auto invocation = Invocation::create(context, make_message(false));
    auto future = invocation->invoke();
    invocation->notify_exception(std::make_exception_ptr(TargetDisconnectedError("closed")));

    ASSERT_TRUE(future->is_done());
    EXPECT_THROW(future->get(), TargetDisconnectedError);
    EXPECT_TRUE(scheduler.tasks.empty());
  }
}

TEST_F(InvocationTest, RedoOperationRetriesAnyFailure)
{
  context.config.redo_operation = true;
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  auto future = invocation->invoke();

  invocation->notify_exception(std::make_exception_ptr(std::runtime_error("server error")));

  EXPECT_FALSE(future->is_done());
  EXPECT_EQ(scheduler.tasks.size(), 1);
}

TEST_F(InvocationTest, UnclassifiedFailureIsTerminal)
{
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  auto future = invocation->invoke();

  invocation->notify_exception(std::make_exception_ptr(std::runtime_error("server error")));

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), std::runtime_error);
  EXPECT_TRUE(scheduler.tasks.empty());
}

TEST_F(InvocationTest, NonStandardSendFailureIsTerminal)
{
  auto invocation = Invocation::create(context, make_message(true));

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).WillOnce(testing::Throw(42));
  auto future = invocation->invoke();

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), int);
  EXPECT_TRUE(scheduler.tasks.empty());
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, ClientNotActiveWrapsCause)
{
  ON_CALL(lifecycle, is_running()).WillByDefault(testing::Return(false));
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  auto future = invocation->invoke();

  invocation->notify_exception(std::make_exception_ptr(IOError("connection reset")));

  ASSERT_TRUE(future->is_done());
  try {
    future->get();
    FAIL() << "Expected ClientNotActiveError";
  } catch (ClientNotActiveError& exc) {
    EXPECT_STREQ(exc.what(), "connection reset");
    EXPECT_THROW(std::rethrow_exception(exc.cause()), IOError);
  }
  EXPECT_TRUE(scheduler.tasks.empty());
}

TEST_F(InvocationTest, RuntimeInactiveDuringRetry)
{
  EXPECT_CALL(lifecycle, is_running())
      .WillOnce(testing::Return(true))
      .WillRepeatedly(testing::Return(false));

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .Times(2)
      .WillRepeatedly(testing::Throw(IOError("no connection")));

  auto invocation = Invocation::create(context, make_message());
  auto future = invocation->invoke();

  EXPECT_FALSE(future->is_done());
  EXPECT_EQ(scheduler.run_pending(), 1);

  ASSERT_TRUE(future->is_done());
  try {
    future->get();
    FAIL() << "Expected ClientNotActiveError";
  } catch (ClientNotActiveError& exc) {
    EXPECT_THROW(std::rethrow_exception(exc.cause()), IOError);
  }
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, RejectedRetrySurfacesOriginalFailure)
{
  scheduler.reject = true;
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .WillOnce(testing::Throw(IOError("no connection")));

  auto future = invocation->invoke();

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), IOError);
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, RetryRejectedByAdmissionCompletesFuture)
{
  FailFastCallIdSequence small_budget{1};
  InvocationContext ctx{lifecycle, service, small_budget, scheduler, executor, context.config};

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .WillOnce(testing::Throw(IOError("no connection")))
      .WillOnce(testing::Return());

  auto invocation = Invocation::create(ctx, make_message());
  auto future = invocation->invoke();
  ASSERT_EQ(scheduler.tasks.size(), 1);

  auto heartbeat = Invocation::create(ctx, make_message());
  heartbeat->invoke_urgent();

  scheduler.run_pending();

  ASSERT_TRUE(future->is_done());
  EXPECT_THROW(future->get(), OverloadError);
  EXPECT_EQ(small_budget.concurrent_invocations(), 1);
}

TEST_F(InvocationTest, NotifyRequiresResponse)
{
  auto invocation = Invocation::create(context, make_message());
  EXPECT_THROW(invocation->notify(nullptr), grid::common::InvalidArgumentError);
  EXPECT_FALSE(invocation->future()->is_done());
}

TEST_F(InvocationTest, LateNotificationsAreIgnored)
{
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  auto future = invocation->invoke();

  auto response = make_response();
  invocation->notify(response);
  invocation->notify(make_response());
  invocation->notify_exception(std::make_exception_ptr(IOError("late failure")));

  EXPECT_EQ(future->get(), response);
  EXPECT_TRUE(scheduler.tasks.empty());
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
  EXPECT_EQ(sequence.last_call_id(), 1);
}

TEST_F(InvocationTest, RetryOfCompletedInvocationIsSkipped)
{
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  auto future = invocation->invoke();

  invocation->notify_exception(std::make_exception_ptr(IOError("no connection")));
  ASSERT_EQ(scheduler.tasks.size(), 1);

  invocation->notify(make_response());
  scheduler.run_pending();

  EXPECT_TRUE(future->is_done());
  EXPECT_FALSE(future->is_completed_exceptionally());
  EXPECT_EQ(sequence.concurrent_invocations(), 0);
}

TEST_F(InvocationTest, SendConnectionOrWait)
{
  auto invocation = Invocation::create(context, make_message());
  EXPECT_EQ(invocation->send_connection(), nullptr);

  ConnectionPtr observed;
  std::thread waiter{[&]() { observed = invocation->send_connection_or_wait(); }};

  std::this_thread::sleep_for(std::chrono::milliseconds{20});
  EXPECT_TRUE(invocation->set_send_connection(connection));
  waiter.join();

  EXPECT_EQ(observed, connection);
  EXPECT_FALSE(invocation->set_send_connection(connection));
}

TEST_F(InvocationTest, SendConnectionOrWaitReturnsNullOnCompletion)
{
  auto invocation = Invocation::create(context, make_message());

  EXPECT_CALL(service, invoke_on_random_target(testing::_)).Times(1);
  invocation->invoke();

  ConnectionPtr observed = connection;
  std::thread waiter{[&]() { observed = invocation->send_connection_or_wait(); }};

  std::this_thread::sleep_for(std::chrono::milliseconds{20});
  invocation->notify_exception(std::make_exception_ptr(std::runtime_error("failed")));
  waiter.join();

  EXPECT_EQ(observed, nullptr);
}

TEST_F(InvocationTest, EventHandlerSurvivesRetries)
{
  auto handler = std::make_shared<testing::NiceMock<MockEventHandler>>();
  auto invocation = Invocation::create(context, make_message());
  invocation->set_event_handler(handler);

  std::vector<EventHandlerPtr> seen;
  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .Times(2)
      .WillRepeatedly([&](const InvocationPtr& inv) { seen.push_back(inv->event_handler()); });

  invocation->invoke();
  invocation->notify_exception(std::make_exception_ptr(IOError("connection reset")));
  scheduler.run_pending();

  ASSERT_EQ(seen.size(), 2);
  EXPECT_EQ(seen[0], handler);
  EXPECT_EQ(seen[1], handler);
}

TEST_F(InvocationTest, DeadlineIsFixedAtConstruction)
{
  auto invocation = Invocation::create(context, make_message());
  auto deadline = invocation->deadline();

  EXPECT_CALL(service, invoke_on_random_target(testing::_))
      .WillOnce(testing::Throw(IOError("no connection")))
      .WillOnce(testing::Return());

  invocation->invoke();
  scheduler.run_pending();

  EXPECT_EQ(invocation->deadline(), deadline);
}
