#include "taskq/tasks/order_archive.hpp"

#include "taskq/broker/memory_store.hpp"
#include "taskq/task/codec.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskq;
using namespace taskq::tasks;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view kOrderId = "3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b34";

auto task_with_payload(std::string_view payload) -> Task {
  auto t = test::make_task("default", kOrderArchive);
  t.payload = to_bytes(payload);
  return t;
}

auto run(const Handler& h, const Task& t) -> HandlerResult {
  TaskContext ctx(t, std::chrono::steady_clock::now() + 10s,
                  CancellationToken::none());
  return h(ctx, t);
}

}  // namespace

TEST(OrderIdTest, AcceptsUuid) {
  EXPECT_TRUE(is_valid_order_id(kOrderId));
  EXPECT_TRUE(is_valid_order_id("3F2B8C1E-9A4D-4E6F-8B21-0C7D5E9A1B34"));
}

TEST(OrderIdTest, RejectsMalformed) {
  EXPECT_FALSE(is_valid_order_id(""));
  EXPECT_FALSE(is_valid_order_id("not-a-uuid"));
  EXPECT_FALSE(is_valid_order_id("3f2b8c1e9a4d4e6f8b210c7d5e9a1b34"));
  EXPECT_FALSE(is_valid_order_id("3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b3z"));
  EXPECT_FALSE(is_valid_order_id("00000000-0000-0000-0000-000000000000"));
}

TEST(OrderIdTest, GeneratedTaskIdsAreUuids) {
  auto a = new_task_id();
  auto b = new_task_id();

  EXPECT_EQ(a.str().size(), 36u);
  EXPECT_EQ(a.str()[14], '4');
  EXPECT_TRUE(is_valid_order_id(a.str()));
  EXPECT_NE(a, b);
}

TEST(OrderArchiveTaskTest, BuildsTypedTask) {
  auto task = make_order_archive_task(kOrderId);

  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->type, "order:archive");
  auto payload = decode_payload<OrderArchivePayload>(task->payload);
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(payload->order_id, kOrderId);
}

TEST(OrderArchiveHandlerTest, ArchivesValidOrder) {
  auto t = task_with_payload(R"({"order_id":"3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b34"})");
  std::optional<Bytes> result;
  Handler h = [&](TaskContext& ctx, const Task& task) -> HandlerResult {
    auto r = handle_order_archive(ctx, task);
    result = ctx.result();
    return r;
  };

  auto r = run(h, t);

  EXPECT_TRUE(r.has_value());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(to_string(*result), kOrderId);
}

TEST(OrderArchiveHandlerTest, UndecodablePayloadSkipsRetry) {
  auto r = run(handle_order_archive, task_with_payload("{not json"));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().skip_retry);
  EXPECT_EQ(r.error().message.rfind("unmarshal payload: ", 0), 0u);
}

TEST(OrderArchiveHandlerTest, WrongFieldTypeSkipsRetry) {
  auto r = run(handle_order_archive, task_with_payload(R"({"order_id":42})"));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().skip_retry);
}

TEST(OrderArchiveHandlerTest, MissingOrderIdSkipsRetry) {
  auto r = run(handle_order_archive, task_with_payload("{}"));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().skip_retry);
  EXPECT_EQ(r.error().message, "order_id is required");
  EXPECT_EQ(r.error().kind, FailureKind::Validation);
}

TEST(OrderArchiveHandlerTest, CancelledContextIsRetryable) {
  auto t = task_with_payload(R"({"order_id":"3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b34"})");
  CancellationSource source;
  source.cancel(CancelReason::Shutdown);
  TaskContext ctx(t, std::chrono::steady_clock::now() + 10s, source.token());

  auto r = handle_order_archive(ctx, t);

  ASSERT_FALSE(r.has_value());
  EXPECT_FALSE(r.error().skip_retry);
}

TEST(BuiltinHandlersTest, RegistersIdempotentArchiveHandler) {
  MemoryStore store;
  IdempotencyGuard guard(store, "idem:");
  HandlerRegistry registry;

  ASSERT_TRUE(register_builtin_handlers(registry, guard, 1h));

  const Handler* h = registry.find(kOrderArchive);
  ASSERT_NE(h, nullptr);
  auto t = task_with_payload(R"({"order_id":"3f2b8c1e-9a4d-4e6f-8b21-0c7d5e9a1b34"})");
  ASSERT_TRUE(run(*h, t));

  // The second delivery of the same task is answered from the cache.
  std::optional<Bytes> cached;
  Handler observe = [&](TaskContext& ctx, const Task& task) -> HandlerResult {
    auto r = (*h)(ctx, task);
    cached = ctx.result();
    return r;
  };
  ASSERT_TRUE(run(observe, t));
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(to_string(*cached), kOrderId);
}

TEST(BuiltinHandlersTest, DuplicateRegistrationFails) {
  MemoryStore store;
  IdempotencyGuard guard(store, "idem:");
  HandlerRegistry registry;
  ASSERT_TRUE(register_builtin_handlers(registry, guard, 1h));

  auto again = register_builtin_handlers(registry, guard, 1h);

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::AlreadyExists);
}
