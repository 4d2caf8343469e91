#include "inotify_watch_service.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace watchbridge::test;

namespace {

namespace fs = std::filesystem;

constexpr std::chrono::milliseconds kDebounce{50};
constexpr std::chrono::milliseconds kSettle{3000};

std::unique_ptr<InotifyWatchService> make_service(TestContext& ctx) {
  InotifyWatchService::Options options;
  options.debounce_delay = kDebounce;
  auto logger = std::make_shared<Logger>("inotify");
  ctx.logs.attach(logger);
  auto service = std::make_unique<InotifyWatchService>(options, logger);
  service->start();
  return service;
}

std::string describe(const RawEvent& ev) {
  std::string text = std::string(raw_event_kind_name(ev.kind)) + " " + ev.path;
  if(ev.kind == RawEvent::Kind::Rename) text += " -> " + ev.target;
  return text;
}

// Drains until an event matching kind/path shows up or the deadline passes.
bool await_event(InotifyWatchService& service,
                 std::vector<RawEvent>& seen,
                 RawEvent::Kind kind,
                 const std::string& path) {
  return wait_for_condition([&](){
    for(auto& ev : service.drain()) seen.push_back(std::move(ev));
    for(const auto& ev : seen) {
      if(ev.kind == kind && ev.path == path) return true;
    }
    return false;
  }, kSettle, std::chrono::milliseconds(20));
}

std::string seen_text(const std::vector<RawEvent>& seen) {
  std::vector<std::string> lines;
  for(const auto& ev : seen) lines.push_back(describe(ev));
  return join_lines(lines);
}

void expect_event(Expect& expect,
                  InotifyWatchService& service,
                  std::vector<RawEvent>& seen,
                  RawEvent::Kind kind,
                  const std::string& path,
                  const std::string& what) {
  bool found = await_event(service, seen, kind, path);
  expect.that(found, what + ", saw: " + seen_text(seen));
}

bool test_create_write_remove(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-basic");
  auto service = make_service(ctx);
  service->watch(tree.path());

  std::vector<RawEvent> seen;
  tree.write("a.txt", "one");
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("a.txt"), "create reported");

  seen.clear();
  tree.write("a.txt", "two");
  expect_event(expect, *service, seen, RawEvent::Kind::Write, tree.path("a.txt"), "write reported");

  seen.clear();
  fs::remove(tree.path("a.txt"));
  expect_event(expect, *service, seen, RawEvent::Kind::Remove, tree.path("a.txt"), "remove reported");
  return report(expect);
}

bool test_burst_is_coalesced(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-burst");
  auto service = make_service(ctx);
  service->watch(tree.path());

  for(int i = 0; i < 5; ++i) tree.write("burst.txt", std::to_string(i));

  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("burst.txt"), "burst reported");
  std::this_thread::sleep_for(kDebounce * 4);
  for(auto& ev : service->drain()) seen.push_back(std::move(ev));
  std::size_t hits = 0;
  for(const auto& ev : seen) {
    if(ev.path == tree.path("burst.txt")) ++hits;
  }
  expect.equal(hits, 1u, "events for burst.txt");
  return report(expect);
}

bool test_rename_is_paired(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-rename");
  tree.write("old.txt", "x");
  auto service = make_service(ctx);
  service->watch(tree.path());

  fs::rename(tree.path("old.txt"), tree.path("new.txt"));

  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Rename, tree.path("old.txt"), "rename reported");
  for(const auto& ev : seen) {
    if(ev.kind == RawEvent::Kind::Rename) {
      expect.equal(ev.target, tree.path("new.txt"), "rename target");
    }
  }
  return report(expect);
}

bool test_move_out_of_tree_is_remove(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-moveout");
  TempTree elsewhere("watchbridge-moveout-dest");
  tree.write("leaving.txt", "x");
  auto service = make_service(ctx);
  service->watch(tree.path());

  fs::rename(tree.path("leaving.txt"), elsewhere.path("leaving.txt"));

  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Remove, tree.path("leaving.txt"), "move-out reported as remove");
  return report(expect);
}

bool test_new_directories_are_watched(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-subdir");
  auto service = make_service(ctx);
  service->watch(tree.path());
  const auto before = service->watch_descriptor_count();

  tree.mkdir("sub/deeper");
  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("sub"), "new directory reported");
  expect.that(wait_for_condition([&](){ return service->watch_descriptor_count() >= before + 2; },
                                 kSettle),
              "nested directories registered");

  seen.clear();
  tree.write("sub/deeper/file.txt", "x");
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("sub/deeper/file.txt"), "file in new directory reported");
  return report(expect);
}

bool test_existing_subdirectories_are_watched(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-existing");
  tree.mkdir("a/b/c");
  auto service = make_service(ctx);
  service->watch(tree.path());
  expect.equal(service->watch_descriptor_count(), 4u, "watch descriptors");

  tree.write("a/b/c/leaf.txt", "x");
  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("a/b/c/leaf.txt"), "deep create reported");
  return report(expect);
}

bool test_missing_root_is_rejected(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-missing");
  auto service = make_service(ctx);
  bool threw = false;
  try {
    service->watch(tree.path("does/not/exist"));
  } catch(const WatchError&) {
    threw = true;
  }
  expect.that(threw, "WatchError for missing root");
  expect.that(!service->is_watching(tree.path("does/not/exist")), "nothing registered");
  expect.equal(service->watch_descriptor_count(), 0u, "watch descriptors");
  return report(expect);
}

bool test_watch_requires_start(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-unstarted");
  auto logger = std::make_shared<Logger>("inotify");
  ctx.logs.attach(logger);
  InotifyWatchService service(InotifyWatchService::Options{}, logger);
  bool threw = false;
  try {
    service.watch(tree.path());
  } catch(const WatchError&) {
    threw = true;
  }
  expect.that(threw, "WatchError before start()");
  return report(expect);
}

bool test_registrations_are_counted(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-refcount");
  auto service = make_service(ctx);
  service->watch(tree.path());
  service->watch(tree.path() + "/");

  service->unwatch(tree.path());
  expect.that(service->is_watching(tree.path()), "still watched after first unwatch");
  expect.that(service->watch_descriptor_count() > 0, "descriptors kept");

  service->unwatch(tree.path());
  expect.that(!service->is_watching(tree.path()), "released after second unwatch");
  expect.equal(service->watch_descriptor_count(), 0u, "watch descriptors");

  service->unwatch(tree.path());
  expect.that(ctx.logs.contains("is not watched"), "unknown unwatch logged");
  return report(expect);
}

bool test_nested_root_survives_parent_unwatch(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-nested");
  tree.mkdir("inner");
  auto service = make_service(ctx);
  service->watch(tree.path());
  service->watch(tree.path("inner"));
  service->unwatch(tree.path());

  expect.that(service->is_watching(tree.path("inner")), "inner root kept");
  expect.equal(service->watch_descriptor_count(), 1u, "watch descriptors");

  tree.write("inner/kept.txt", "x");
  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("inner/kept.txt"), "inner events still delivered");
  return report(expect);
}

bool test_symlinked_directories_are_not_followed(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-symlink");
  TempTree target("watchbridge-symlink-target");
  std::error_code ec;
  fs::create_directory_symlink(target.root(), tree.root() / "link", ec);
  expect.that(!ec, "symlink created");

  auto service = make_service(ctx);
  service->watch(tree.path());
  expect.equal(service->watch_descriptor_count(), 1u, "only the root is watched");

  target.write("outside.txt", "x");
  tree.write("inside.txt", "x");

  std::vector<RawEvent> seen;
  expect_event(expect, *service, seen, RawEvent::Kind::Create, tree.path("inside.txt"), "inside change reported");
  std::this_thread::sleep_for(kDebounce * 4);
  for(auto& ev : service->drain()) seen.push_back(std::move(ev));
  for(const auto& ev : seen) {
    expect.that(ev.path.find("outside.txt") == std::string::npos,
                "no event through the symlink: " + describe(ev));
  }
  return report(expect);
}

bool test_stop_is_idempotent(TestContext& ctx) {
  Expect expect;
  TempTree tree("watchbridge-stop");
  auto service = make_service(ctx);
  service->watch(tree.path());
  service->stop();
  service->stop();
  expect.equal(service->watch_descriptor_count(), 0u, "descriptors released");
  expect.that(!service->is_watching(tree.path()), "roots released");
  return report(expect);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"create_write_remove", test_create_write_remove},
    {"burst_is_coalesced", test_burst_is_coalesced},
    {"rename_is_paired", test_rename_is_paired},
    {"move_out_of_tree_is_remove", test_move_out_of_tree_is_remove},
    {"new_directories_are_watched", test_new_directories_are_watched},
    {"existing_subdirectories_are_watched", test_existing_subdirectories_are_watched},
    {"missing_root_is_rejected", test_missing_root_is_rejected},
    {"watch_requires_start", test_watch_requires_start},
    {"registrations_are_counted", test_registrations_are_counted},
    {"nested_root_survives_parent_unwatch", test_nested_root_survives_parent_unwatch},
    {"symlinked_directories_are_not_followed", test_symlinked_directories_are_not_followed},
    {"stop_is_idempotent", test_stop_is_idempotent},
  };
  return run_suite("watch", std::move(tests), argc, argv);
}
