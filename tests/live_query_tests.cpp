#include "live_query.hpp"
#include "test_runner_utils.hpp"

namespace docsync::test {

namespace {

struct QueryFixture {
  TempWorkspace workspace;
  asio::io_context io;
  std::shared_ptr<LocalStore> store;
  std::shared_ptr<ObserverRegistry> registry = std::make_shared<ObserverRegistry>();
  Container container;

  QueryFixture(const std::string& name, TestContext& ctx) : workspace(name) {
    store = workspace.make_store(ctx.logger);
    SyncError error;
    container = *store->resolve_container("docs", error);
  }

  std::shared_ptr<LiveQuery> make(QueryPredicate predicate, TestContext& ctx) {
    return LiveQuery::create(asio::make_strand(io), store, container, std::move(predicate),
                             registry, ctx.logger->child("live-query"));
  }

  void settle() {
    for(int i = 0; i < 8; ++i) {
      io.restart();
      io.poll();
    }
  }
};

bool test_gathering_precedes_updates(TestContext& ctx) {
  QueryFixture f("live_gather", ctx);
  f.workspace.write_file("store/docs/a.txt", "alpha");

  std::vector<MetadataEvent> events;
  std::vector<std::size_t> counts;
  auto query = f.make(QueryPredicate::container(), ctx);
  query->subscribe_all([&](LiveQuery& q, MetadataEvent event){
    events.push_back(event);
    counts.push_back(q.result_count());
  });
  query->start();
  f.settle();
  f.store->seed_remote_item("docs", "b.txt", "beta");
  f.settle();

  bool ok = expect(events.size() == 2, "two notifications");
  if(events.size() == 2) {
    ok &= expect(events[0] == MetadataEvent::GatheringFinished, "gathering finished first");
    ok &= expect(events[1] == MetadataEvent::Updated, "then an update");
    ok &= expect(counts[0] == 1 && counts[1] == 2, "full result set each time");
  }
  ok &= expect(query->phase() == QueryPhase::Settled, "settled");
  query->stop();
  return ok;
}

bool test_changes_during_gathering_are_progress(TestContext& ctx) {
  QueryFixture f("live_held", ctx);
  f.store->hold_gathering();

  std::vector<MetadataEvent> events;
  auto query = f.make(QueryPredicate::container(), ctx);
  query->subscribe_all([&](LiveQuery&, MetadataEvent event){ events.push_back(event); });
  query->start();
  f.settle();
  f.store->seed_remote_item("docs", "early.txt", "1");
  f.settle();
  f.store->release_gathering();
  f.settle();
  f.store->seed_remote_item("docs", "late.txt", "2");
  f.settle();

  bool ok = expect(events.size() == 3, "three notifications");
  if(events.size() == 3) {
    ok &= expect(events[0] == MetadataEvent::GatheringProgress, "progress while gathering");
    ok &= expect(events[1] == MetadataEvent::GatheringFinished, "finished on release");
    ok &= expect(events[2] == MetadataEvent::Updated, "update afterwards");
  }
  query->stop();
  return ok;
}

bool test_stop_releases_every_observer_once(TestContext& ctx) {
  QueryFixture f("live_stop", ctx);
  auto query = f.make(QueryPredicate::item("a.txt"), ctx);
  query->subscribe_all([](LiveQuery&, MetadataEvent){});
  query->start();
  f.settle();

  bool ok = expect(f.registry->token_count(query->key()) == 3, "one token per event kind");
  ok &= expect(f.store->open_query_count() == 1, "backend query open");
  ok &= expect(query->stop(), "first stop tears down");
  ok &= expect(!query->stop(), "second stop is a no-op");
  ok &= expect(f.registry->token_count(query->key()) == 0, "tokens released");
  ok &= expect(f.registry->release_all(query->key()) == 0, "nothing left to release");
  ok &= expect(f.store->open_query_count() == 0, "backend query closed");
  ok &= expect(ctx.logs.count_substring("3 observer(s) released") == 1, "teardown logged once");
  return ok;
}

bool test_stop_from_listener_silences_query(TestContext& ctx) {
  QueryFixture f("live_self_stop", ctx);
  int calls = 0;
  auto query = f.make(QueryPredicate::container(), ctx);
  query->subscribe_all([&](LiveQuery& q, MetadataEvent){
    ++calls;
    q.stop();
  });
  query->start();
  f.settle();
  f.store->seed_remote_item("docs", "x.txt", "x");
  f.settle();

  bool ok = expect(calls == 1, "only the first notification is delivered");
  ok &= expect(query->phase() == QueryPhase::Stopped, "stopped");
  return ok;
}

bool test_item_query_sees_only_its_item(TestContext& ctx) {
  QueryFixture f("live_item", ctx);
  f.workspace.write_file("store/docs/keep.txt", "k");
  f.workspace.write_file("store/docs/other.txt", "o");

  std::size_t results = 0;
  std::string first;
  auto query = f.make(QueryPredicate::item("keep.txt"), ctx);
  query->subscribe(MetadataEvent::GatheringFinished, [&](LiveQuery& q, MetadataEvent){
    results = q.result_count();
    if(const auto* raw = q.first_result()) first = raw->at("relativePath").get<std::string>();
  });
  query->start();
  f.settle();
  query->stop();

  bool ok = expect(results == 1, "single result");
  ok &= expect(first == "keep.txt", "the requested item");
  return ok;
}

} // namespace

std::vector<TestCase> live_query_tests() {
  return {
    {"live_query_gathering_precedes_updates", test_gathering_precedes_updates},
    {"live_query_changes_during_gathering_are_progress", test_changes_during_gathering_are_progress},
    {"live_query_stop_releases_every_observer_once", test_stop_releases_every_observer_once},
    {"live_query_stop_from_listener_silences_query", test_stop_from_listener_silences_query},
    {"live_query_item_query_sees_only_its_item", test_item_query_sees_only_its_item},
  };
}

} // namespace docsync::test
