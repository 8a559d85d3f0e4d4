#include "sync_coordinator.hpp"
#include "test_runner_utils.hpp"

#include <cmath>

using namespace std::chrono_literals;

namespace docsync::test {

namespace {

struct CoordinatorFixture {
  TempWorkspace workspace;
  asio::io_context io;
  std::shared_ptr<LocalStore> store;
  std::unique_ptr<SyncCoordinator> coordinator;

  CoordinatorFixture(const std::string& name, TestContext& ctx,
                     bool auto_materialize = true, CoordinatorOptions options = {})
    : workspace(name) {
    store = workspace.make_store(ctx.logger, auto_materialize);
    coordinator = std::make_unique<SyncCoordinator>(io, store, std::move(options),
                                                    ctx.logger->child("coordinator"));
  }

  std::filesystem::path container_root() const {
    return store->root() / "docs";
  }
};

struct DoneResult {
  int calls = 0;
  SyncError error;
  std::chrono::milliseconds at{0};
};

CoordinatorOptions short_download_options() {
  CoordinatorOptions options;
  options.download_schedule.idle = {5s, 5s, 5s};
  options.download_schedule.backoff = {1s, 1s};
  return options;
}

bool test_list_isolates_malformed_records(TestContext& ctx) {
  CoordinatorFixture f("coord_list", ctx);
  for(int i = 0; i < 100; ++i) {
    f.workspace.write_file("store/docs/file" + std::to_string(i) + ".txt", "x");
  }
  f.store->inject_raw_entry("docs", nlohmann::json{{"relativePath", 7}});
  ManualTimeline timeline(f.io);

  int calls = 0;
  ItemListing listing;
  SyncError error;
  f.coordinator->list_items("docs", [&](const SyncError& err, const ItemListing& result){
    ++calls;
    error = err;
    listing = result;
  });
  timeline.settle();

  bool ok = expect(calls == 1 && !error, "one successful listing: " + error.message());
  ok &= expect(listing.items.size() == 100, "every valid item listed, got " + std::to_string(listing.items.size()));
  ok &= expect(listing.invalid_entries.size() == 1, "one diagnostic");
  ok &= expect(ctx.logs.count_substring("1 of 101 record(s) could not be mapped") == 1, "mapping failure logged");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "query closed");
  ok &= expect(f.coordinator->active_operations() == 0, "operation finished");
  return ok;
}

bool test_watch_listing_until_canceled(TestContext& ctx) {
  CoordinatorFixture f("coord_watch", ctx);
  f.workspace.write_file("store/docs/a.txt", "a");
  ManualTimeline timeline(f.io);

  std::vector<std::size_t> sizes;
  int done_calls = 0;
  SyncError done_error;
  auto id = f.coordinator->list_items("docs",
    [&](const SyncError& err, const ItemListing&){
      ++done_calls;
      done_error = err;
    },
    [&](const SyncError&, const ItemListing& listing){ sizes.push_back(listing.items.size()); });
  timeline.settle();
  f.store->seed_remote_item("docs", "b.txt", "b");
  timeline.settle();

  bool ok = expect(sizes == std::vector<std::size_t>({1, 2}), "initial listing and one update");
  ok &= expect(done_calls == 0, "watch stays open");
  ok &= expect(f.coordinator->cancel(id), "cancel accepted");
  timeline.settle();
  ok &= expect(done_calls == 1 && done_error.is(sync_errc::canceled), "ended by cancellation");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "query closed");
  return ok;
}

bool test_download_stalls_after_schedule(TestContext& ctx) {
  CoordinatorFixture f("coord_stall", ctx, false, short_download_options());
  f.store->seed_remote_item("docs", "stuck.bin", "never arrives");
  ManualTimeline timeline(f.io);

  DoneResult result;
  f.coordinator->download("docs", "stuck.bin", f.workspace.root() / "out" / "stuck.bin",
    [&](const SyncError& err){
      ++result.calls;
      result.error = err;
      result.at = timeline.elapsed();
    });
  timeline.run_until([&]{ return result.calls > 0; }, 60s);

  bool ok = expect(result.calls == 1, "one completion");
  ok &= expect(result.error.is(sync_errc::stalled_transfer), "stalled: " + result.error.message());
  ok &= expect(result.at == 17s, "5+1+5+1+5 seconds, got " + std::to_string(result.at.count()) + " ms");
  ok &= expect(f.store->download_requests("docs", "stuck.bin") == 3, "one request per attempt");
  ok &= expect(!std::filesystem::exists(f.workspace.root() / "out" / "stuck.bin"), "nothing copied");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "observers released");
  return ok;
}

bool test_download_reports_progress(TestContext& ctx) {
  CoordinatorFixture f("coord_progress", ctx, false, short_download_options());
  f.store->seed_remote_item("docs", "big.bin", "payload");
  ManualTimeline timeline(f.io);

  std::vector<TransferEvent> events;
  std::mutex events_mutex;
  f.coordinator->create_progress_channel("download:big.bin", [&](const TransferEvent& e){
    std::lock_guard<std::mutex> lock(events_mutex);
    events.push_back(e);
  });

  DoneResult result;
  auto destination = f.workspace.root() / "out" / "big.bin";
  f.coordinator->download("docs", "big.bin", destination,
    [&](const SyncError& err){
      ++result.calls;
      result.error = err;
    }, "download:big.bin");
  timeline.advance(1s);
  for(double percent : {25.0, 50.0, 50.0, 75.0}) {
    f.store->report_download_progress("docs", "big.bin", percent);
    timeline.advance(1s);
  }
  f.store->complete_download("docs", "big.bin");
  timeline.settle();

  bool ok = expect(result.calls == 1 && !result.error, "download succeeds: " + result.error.message());
  ok &= expect(read_file(destination) == "payload", "content copied");

  std::vector<double> fractions;
  std::size_t terminals = 0;
  for(const auto& e : events) {
    if(e.type == TransferEvent::Type::Progress) fractions.push_back(e.fraction);
    if(e.is_terminal()) ++terminals;
  }
  ok &= expect(!fractions.empty() && fractions.back() == 1.0, "progress ends at 1.0");
  ok &= expect(std::is_sorted(fractions.begin(), fractions.end()) &&
               std::adjacent_find(fractions.begin(), fractions.end()) == fractions.end(),
               "strictly increasing");
  ok &= expect(terminals == 1 && events.back().type == TransferEvent::Type::Done, "single done event last");
  ok &= expect(!f.coordinator->cancel_progress_channel("download:big.bin"), "channel removed once terminal");
  return ok;
}

bool test_download_directory_copies_tree(TestContext& ctx) {
  CoordinatorFixture f("coord_download_dir", ctx);
  f.workspace.write_file("store/docs/album/cover.txt", "cover");
  f.workspace.write_file("store/docs/album/tracks/one.txt", "one");
  auto destination = f.workspace.write_file("out/album", "stale file in the way");
  ManualTimeline timeline(f.io);

  DoneResult result;
  f.coordinator->download("docs", "album", destination, [&](const SyncError& err){
    ++result.calls;
    result.error = err;
  });
  timeline.settle();

  bool ok = expect(result.calls == 1 && !result.error, "directory download succeeds: " + result.error.message());
  ok &= expect(std::filesystem::is_directory(destination), "destination is a directory");
  ok &= expect(read_file(destination / "cover.txt") == "cover", "top-level file copied");
  ok &= expect(read_file(destination / "tracks" / "one.txt") == "one", "nested file copied");
  return ok;
}

bool test_read_missing_item_is_absent(TestContext& ctx) {
  CoordinatorFixture f("coord_read_missing", ctx);
  ManualTimeline timeline(f.io);

  int calls = 0;
  SyncError error;
  std::optional<std::string> bytes = std::string("sentinel");
  f.coordinator->read_in_place("docs", "nowhere.txt", [&](const SyncError& err, const std::optional<std::string>& b){
    ++calls;
    error = err;
    bytes = b;
  });
  timeline.settle();

  bool ok = expect(calls == 1 && !error, "no error for a missing item");
  ok &= expect(!bytes, "absent value");
  return ok;
}

bool test_write_then_read_in_place(TestContext& ctx) {
  CoordinatorFixture f("coord_write_read", ctx);
  ManualTimeline timeline(f.io);

  DoneResult written;
  f.coordinator->write_in_place("docs", "notes/today.md", "hello world", [&](const SyncError& err){
    ++written.calls;
    written.error = err;
  });
  timeline.settle();
  bool ok = expect(written.calls == 1 && !written.error, "write succeeds: " + written.error.message());
  ok &= expect(read_file(f.container_root() / "notes" / "today.md") == "hello world", "file in container");

  std::optional<std::string> bytes;
  SyncError error;
  f.coordinator->read_in_place("docs", "notes/today.md", [&](const SyncError& err, const std::optional<std::string>& b){
    error = err;
    bytes = b;
  });
  timeline.settle();
  ok &= expect(!error && bytes && *bytes == "hello world", "read returns the written bytes");
  return ok;
}

bool test_exists_and_metadata(TestContext& ctx) {
  CoordinatorFixture f("coord_lookup", ctx);
  f.workspace.write_file("store/docs/present.txt", "12345");
  ManualTimeline timeline(f.io);

  std::optional<bool> present;
  std::optional<bool> absent;
  std::optional<ItemDescriptor> item;
  SyncError metadata_error;
  f.coordinator->exists("docs", "present.txt", [&](const SyncError&, bool found){ present = found; });
  f.coordinator->exists("docs", "absent.txt", [&](const SyncError&, bool found){ absent = found; });
  f.coordinator->metadata("docs", "present.txt", [&](const SyncError& err, const std::optional<ItemDescriptor>& d){
    metadata_error = err;
    item = d;
  });
  timeline.settle();

  bool ok = expect(present && *present, "present item exists");
  ok &= expect(absent && !*absent, "absent item does not");
  ok &= expect(!metadata_error && item, "metadata found");
  if(item) {
    ok &= expect(item->relative_path == "present.txt", "relative path");
    ok &= expect(item->size_in_bytes && *item->size_in_bytes == 5, "size");
    ok &= expect(item->download_state == DownloadState::Current, "current");
  }
  return ok;
}

bool test_unanswered_lookup_times_out(TestContext& ctx) {
  CoordinatorFixture f("coord_timeout", ctx);
  f.store->hold_gathering();
  ManualTimeline timeline(f.io, 500ms);

  std::optional<bool> found;
  SyncError exists_error;
  SyncError metadata_error;
  int metadata_calls = 0;
  f.coordinator->exists("docs", "slow.txt", [&](const SyncError& err, bool value){
    exists_error = err;
    found = value;
  });
  f.coordinator->metadata("docs", "slow.txt", [&](const SyncError& err, const std::optional<ItemDescriptor>&){
    ++metadata_calls;
    metadata_error = err;
  });

  timeline.advance(29s);
  bool ok = expect(!found && metadata_calls == 0, "still pending before the timeout");
  ok &= expect(ctx.logs.count_substring("metadata lookup for slow.txt still pending after 10000 ms") == 2,
               "warning logged once per lookup");
  timeline.advance(1s);

  ok &= expect(found && !*found && !exists_error, "existence check reports absent");
  ok &= expect(metadata_calls == 1 && metadata_error.is(sync_errc::query_timeout), "metadata times out");
  ok &= expect(ctx.logs.count_substring("existence check for slow.txt timed out") == 1, "timeout logged");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "queries released");
  f.store->release_gathering();
  return ok;
}

bool test_delete_move_copy(TestContext& ctx) {
  CoordinatorFixture f("coord_fileops", ctx);
  f.workspace.write_file("store/docs/a.txt", "alpha");
  f.workspace.write_file("store/docs/dir/inner.txt", "inner");
  ManualTimeline timeline(f.io);

  auto run = [&](auto start){
    DoneResult result;
    start([&](const SyncError& err){
      ++result.calls;
      result.error = err;
    });
    timeline.settle();
    return result;
  };
  auto root = f.container_root();

  auto copied = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->copy("docs", "a.txt", "b.txt", done); });
  bool ok = expect(copied.calls == 1 && !copied.error, "copy succeeds: " + copied.error.message());
  ok &= expect(read_file(root / "a.txt") == "alpha" && read_file(root / "b.txt") == "alpha", "both present");

  auto dir_copy = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->copy("docs", "dir/", "dir2", done); });
  ok &= expect(!dir_copy.error, "directory copy succeeds: " + dir_copy.error.message());
  ok &= expect(read_file(root / "dir2" / "inner.txt") == "inner", "directory copied recursively");

  auto moved = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->move("docs", "b.txt", "sub/c.txt", done); });
  ok &= expect(!moved.error, "move succeeds: " + moved.error.message());
  ok &= expect(!std::filesystem::exists(root / "b.txt") && read_file(root / "sub" / "c.txt") == "alpha", "moved");

  auto removed = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->remove("docs", "a.txt", done); });
  ok &= expect(!removed.error && !std::filesystem::exists(root / "a.txt"), "deleted");

  auto missing = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->remove("docs", "a.txt", done); });
  ok &= expect(missing.calls == 1 && missing.error.is(sync_errc::not_found), "second delete is not_found");

  auto same = run([&](SyncCoordinator::DoneHandler done){ f.coordinator->move("docs", "dir", "dir/", done); });
  ok &= expect(same.error.is(sync_errc::invalid_argument), "moving onto itself is rejected");
  ok &= expect(f.coordinator->active_operations() == 0, "all operations finished");
  ok &= expect(f.store->path_lock_count() == 0, "no path locks left behind");
  return ok;
}

bool test_coordinated_access_releases_path_locks(TestContext& ctx) {
  TempWorkspace workspace("coord_path_locks");
  auto store = workspace.make_store(ctx.logger);
  SyncError error;
  auto container = store->resolve_container("docs", error);
  bool ok = expect(container.has_value() && !error, "container resolves: " + error.message());
  if(!container) return ok;

  std::atomic<int> inside{0};
  std::atomic<int> overlaps{0};
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for(int t = 0; t < 4; ++t) {
    workers.emplace_back([&, t]{
      for(int i = 0; i < 25; ++i) {
        // Every access shares "shared.txt"; the second path is unique per call.
        std::vector<CoordinatedItem> items = {
          {"shared.txt", AccessIntent::Replacing},
          {"worker" + std::to_string(t) + "/" + std::to_string(i) + ".txt", AccessIntent::Replacing},
        };
        auto err = store->coordinate(*container, items, [&](const std::vector<std::filesystem::path>& paths){
          if(inside.fetch_add(1) != 0) overlaps.fetch_add(1);
          std::filesystem::create_directories(paths[1].parent_path());
          std::ofstream(paths[0]) << t << ":" << i;
          std::ofstream(paths[1]) << i;
          inside.fetch_sub(1);
          return SyncError();
        });
        if(err) failures.fetch_add(1);
      }
    });
  }
  for(auto& worker : workers) worker.join();

  ok &= expect(failures == 0, "every access succeeds");
  ok &= expect(overlaps == 0, "accesses to the shared path never overlap");
  ok &= expect(store->path_lock_count() == 0, "lock slots dropped once released, left " +
               std::to_string(store->path_lock_count()));
  return ok;
}

bool test_cancel_delivers_single_canceled(TestContext& ctx) {
  CoordinatorFixture f("coord_cancel", ctx);
  f.store->hold_gathering();
  ManualTimeline timeline(f.io);

  int calls = 0;
  SyncError error;
  auto id = f.coordinator->metadata("docs", "pending.txt", [&](const SyncError& err, const std::optional<ItemDescriptor>&){
    ++calls;
    error = err;
  });
  timeline.advance(1s);
  bool ok = expect(f.coordinator->registry()->active_queries() == 1, "lookup waiting on the index");
  ok &= expect(f.coordinator->cancel(id), "first cancel accepted");
  timeline.settle();
  ok &= expect(!f.coordinator->cancel(id), "second cancel finds nothing");
  timeline.advance(40s);

  ok &= expect(calls == 1 && error.is(sync_errc::canceled), "exactly one canceled completion");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "observers released");
  ok &= expect(f.coordinator->active_operations() == 0, "operation removed");
  f.store->release_gathering();
  return ok;
}

bool test_cancel_download_through_channel(TestContext& ctx) {
  CoordinatorFixture f("coord_channel_cancel", ctx, false);
  f.store->seed_remote_item("docs", "slow.bin", "x");
  ManualTimeline timeline(f.io);

  std::vector<TransferEvent> events;
  f.coordinator->create_progress_channel("download:slow.bin", [&](const TransferEvent& e){ events.push_back(e); });
  DoneResult result;
  f.coordinator->download("docs", "slow.bin", f.workspace.root() / "slow.bin", [&](const SyncError& err){
    ++result.calls;
    result.error = err;
  }, "download:slow.bin");
  timeline.advance(2s);
  bool ok = expect(f.coordinator->cancel_progress_channel("download:slow.bin"), "channel found");
  timeline.settle();

  ok &= expect(result.calls == 1 && result.error.is(sync_errc::canceled), "download canceled");
  ok &= expect(!events.empty() && events.back().type == TransferEvent::Type::Error &&
               events.back().error.is(sync_errc::canceled), "channel ends with the cancellation");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "watchdog released");
  return ok;
}

bool test_upload_monitors_transfer(TestContext& ctx) {
  CoordinatorFixture f("coord_upload", ctx);
  f.store->set_auto_upload(false);
  auto source = f.workspace.write_file("outbox/report.pdf", "pdf bytes");
  ManualTimeline timeline(f.io);

  std::vector<TransferEvent> events;
  f.coordinator->create_progress_channel("upload:report.pdf", [&](const TransferEvent& e){ events.push_back(e); });
  DoneResult result;
  f.coordinator->upload("docs", source, "reports/report.pdf", [&](const SyncError& err){
    ++result.calls;
    result.error = err;
  }, "upload:report.pdf");
  timeline.settle();

  bool ok = expect(result.calls == 1 && !result.error, "copy into the container succeeds");
  ok &= expect(read_file(f.container_root() / "reports" / "report.pdf") == "pdf bytes", "content in place");
  ok &= expect(ctx.logs.count_substring("uploaded reports/report.pdf into docs") == 1, "upload logged");
  ok &= expect(events.empty(), "no transfer reported yet");

  f.store->report_upload_progress("docs", "reports/report.pdf", 40.0);
  timeline.settle();
  ok &= expect(events.size() == 1 && events[0].type == TransferEvent::Type::Progress &&
               std::abs(events[0].fraction - 0.4) < 1e-9, "40 percent reported");

  f.store->report_upload_progress("docs", "reports/report.pdf", 100.0);
  timeline.settle();
  ok &= expect(events.size() == 2 && events.back().type == TransferEvent::Type::Done, "done once uploaded");
  ok &= expect(f.coordinator->registry()->active_queries() == 0, "monitor released");
  return ok;
}

bool test_upload_failure_reaches_channel(TestContext& ctx) {
  CoordinatorFixture f("coord_upload_fail", ctx);
  f.store->set_auto_upload(false);
  auto source = f.workspace.write_file("outbox/a.txt", "a");
  ManualTimeline timeline(f.io);

  std::vector<TransferEvent> events;
  f.coordinator->create_progress_channel("upload:a.txt", [&](const TransferEvent& e){ events.push_back(e); });
  f.coordinator->upload("docs", source, "a.txt", [](const SyncError&){}, "upload:a.txt");
  timeline.settle();
  f.store->fail_upload("docs", "a.txt", "quota exceeded");
  timeline.settle();

  bool ok = expect(!events.empty() && events.back().type == TransferEvent::Type::Error, "error terminal");
  if(!events.empty()) {
    ok &= expect(events.back().error.is(sync_errc::store_error), "store error");
  }
  return ok;
}

bool test_upload_missing_source_is_not_found(TestContext& ctx) {
  CoordinatorFixture f("coord_upload_missing", ctx);
  ManualTimeline timeline(f.io);

  DoneResult result;
  f.coordinator->upload("docs", f.workspace.root() / "nope.txt", "nope.txt", [&](const SyncError& err){
    ++result.calls;
    result.error = err;
  });
  timeline.settle();
  bool ok = expect(result.calls == 1 && result.error.is(sync_errc::not_found), "missing source");
  ok &= expect(!std::filesystem::exists(f.container_root() / "nope.txt"), "nothing created");
  return ok;
}

bool test_unavailable_store(TestContext& ctx) {
  CoordinatorFixture f("coord_unavailable", ctx);
  f.store->set_available(false);
  ManualTimeline timeline(f.io);

  SyncError error;
  f.coordinator->list_items("docs", [&](const SyncError& err, const ItemListing&){ error = err; });
  timeline.settle();

  std::filesystem::path path;
  auto path_error = f.coordinator->container_path("docs", path);
  bool ok = expect(!f.coordinator->available(), "reports unavailable");
  ok &= expect(error.is(sync_errc::container_unavailable), "listing fails with E_CTR");
  ok &= expect(path_error.is(sync_errc::container_unavailable), "no container path");

  f.store->set_available(true);
  path_error = f.coordinator->container_path("docs", path);
  ok &= expect(!path_error && path == f.container_root(), "container path once reachable");
  return ok;
}

bool test_invalid_paths_rejected(TestContext& ctx) {
  CoordinatorFixture f("coord_invalid", ctx);
  ManualTimeline timeline(f.io);

  SyncError error;
  f.coordinator->write_in_place("docs", "/", "x", [&](const SyncError& err){ error = err; });
  timeline.settle();
  return expect(error.is(sync_errc::invalid_argument), "empty path rejected: " + error.message());
}

bool test_conflict_error_surfaces(TestContext& ctx) {
  CoordinatorFixture f("coord_conflict", ctx);
  f.workspace.write_file("store/docs/report.txt", "local");
  ManualTimeline timeline(f.io);

  f.store->fail_next_replace("version store offline");
  f.store->add_conflict_version("docs", "report.txt", "remote", WallTime(std::chrono::seconds(1700000000)));
  timeline.settle();

  auto error = f.coordinator->conflict_error("docs", "report.txt");
  bool ok = expect(error && error->is(sync_errc::store_error), "failed resolution surfaced");

  f.coordinator->metadata("docs", "report.txt", [](const SyncError&, const std::optional<ItemDescriptor>&){});
  timeline.settle();
  ok &= expect(ctx.logs.count_substring("report.txt still has unresolved conflicts") == 1, "reported on access");

  f.store->add_conflict_version("docs", "report.txt", "newest", WallTime(std::chrono::seconds(1700000100)));
  timeline.settle();
  ok &= expect(!f.coordinator->conflict_error("docs", "report.txt"), "cleared after a successful resolution");
  ok &= expect(read_file(f.container_root() / "report.txt") == "newest", "newest version kept");
  return ok;
}

} // namespace

std::vector<TestCase> sync_coordinator_tests() {
  return {
    {"coordinator_list_isolates_malformed_records", test_list_isolates_malformed_records},
    {"coordinator_watch_listing_until_canceled", test_watch_listing_until_canceled},
    {"coordinator_download_stalls_after_schedule", test_download_stalls_after_schedule},
    {"coordinator_download_reports_progress", test_download_reports_progress},
    {"coordinator_download_directory_copies_tree", test_download_directory_copies_tree},
    {"coordinator_read_missing_item_is_absent", test_read_missing_item_is_absent},
    {"coordinator_write_then_read_in_place", test_write_then_read_in_place},
    {"coordinator_exists_and_metadata", test_exists_and_metadata},
    {"coordinator_unanswered_lookup_times_out", test_unanswered_lookup_times_out},
    {"coordinator_coordinated_access_releases_path_locks", test_coordinated_access_releases_path_locks},
    {"coordinator_delete_move_copy", test_delete_move_copy},
    {"coordinator_cancel_delivers_single_canceled", test_cancel_delivers_single_canceled},
    {"coordinator_cancel_download_through_channel", test_cancel_download_through_channel},
    {"coordinator_upload_monitors_transfer", test_upload_monitors_transfer},
    {"coordinator_upload_failure_reaches_channel", test_upload_failure_reaches_channel},
    {"coordinator_upload_missing_source_is_not_found", test_upload_missing_source_is_not_found},
    {"coordinator_unavailable_store", test_unavailable_store},
    {"coordinator_invalid_paths_rejected", test_invalid_paths_rejected},
    {"coordinator_conflict_error_surfaces", test_conflict_error_surfaces},
  };
}

} // namespace docsync::test
