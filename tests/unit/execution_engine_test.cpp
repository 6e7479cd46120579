#include "internal/execution/execution_engine.hpp"
#include "internal/execution/content_plan.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/run_in_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs = std::filesystem;

using usbforge::execution::CopyItem;
using usbforge::execution::ExecutionEngine;
using usbforge::execution::VerificationConfig;
using usbforge::execution::VerificationStrategy;
namespace error_code = usbforge::execution::error_code;

struct Fixture {
  fs::path                                   root;
  std::shared_ptr<usbforge::db::Repository>  repository = std::make_shared<usbforge::db::memory::MemoryRepository>();
  std::shared_ptr<usbforge::joblog::LogSink> log_sink   = std::make_shared<usbforge::joblog::LogSink>(repository);
  int64_t                                    job_id     = 0;

  explicit Fixture(const std::string& name) {
    root = fs::temp_directory_path() / ("usbforge_execution_engine_" + name + "_" + usbforge::util::GenerateJobToken());
    fs::create_directories(root / "src");

    usbforge::model::Job job;
    job.job_token = usbforge::util::GenerateJobToken();
    job.order_ref = "order-" + name;
    job.capacity  = "8GB";
    usbforge::db::RunInTransaction(*repository, [&](usbforge::db::Transaction& tx) {
      usbforge::db::ThrowIfError(repository->InsertJob(tx, job), "insert job");
    });
    job_id = job.id;
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path Write(const fs::path& relative, const std::string& content) {
    const auto path = root / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  bool Logged(const std::string& code) {
    usbforge::db::LogFilter filter;
    filter.job_id     = job_id;
    filter.error_code = code;
    return !log_sink->Query(filter, 10).empty();
  }
};

uint64_t Plenty(const fs::path&) {
  return 1ull << 40;
}

void TestValidationClassifiesFiles() {
  Fixture f("validate");
  const auto good  = f.Write("src/good.bin", "12345");
  const auto empty = f.Write("src/empty.bin", "");
  const auto dir   = f.root / "src" / "folder";
  fs::create_directories(dir);
  const auto missing = f.root / "src" / "missing.bin";

  ExecutionEngine engine(f.log_sink, Plenty, 1);
  auto result = engine.ValidateFiles(f.job_id, {good, empty, dir, missing});

  assert(!result.valid);
  assert(result.ValidCount() == 1);
  assert(result.valid_files[0] == good);
  assert(result.total_size == 5);
  assert(result.errors.size() == 3);
  assert(result.errors[0].code == error_code::kEmptyFile);
  assert(result.errors[1].code == error_code::kNotFile);
  assert(result.errors[2].code == error_code::kNotFound);
  assert(f.Logged(error_code::kNotFound));

  auto clean = engine.ValidateFiles(f.job_id, {good});
  assert(clean.valid);
}

void TestSpaceCheck() {
  Fixture f("space");

  ExecutionEngine small(f.log_sink, [](const fs::path&) -> uint64_t { return 100; }, 1);
  assert(small.CheckSpace(f.job_id, f.root / "dst", 100));
  assert(!small.CheckSpace(f.job_id, f.root / "dst", 101));

  ExecutionEngine broken(f.log_sink, [](const fs::path&) -> uint64_t { throw std::runtime_error("no such device"); }, 1);
  assert(!broken.CheckSpace(f.job_id, f.root / "dst", 1));
  assert(f.Logged(error_code::kSpaceCheckFailed));

  // nonexistent destination directories are measured on their volume
  ExecutionEngine real(f.log_sink);
  assert(real.CheckSpace(f.job_id, f.root / "not" / "yet" / "created", 1));
}

void TestCopyReportsProgressAndKeepsGoing() {
  Fixture f("copy");

  std::vector<CopyItem> items;
  for (int i = 0; i < 4; ++i) {
    const auto source = f.Write("src/file-" + std::to_string(i) + ".txt", std::string(100 + i, 'x'));
    items.push_back({source, f.root / "dst" / "nested" / source.filename()});
  }
  items.insert(items.begin() + 2, CopyItem{f.root / "src" / "gone.txt", f.root / "dst" / "gone.txt"});

  ExecutionEngine      engine(f.log_sink, Plenty, 1);
  std::vector<int32_t> progress;
  auto result = engine.CopyFiles(f.job_id, items, [&](int32_t p) { progress.push_back(p); });

  assert(!result.success);
  assert(!result.aborted);
  assert(result.files_processed == 4);
  assert(result.copied.size() == 4);
  assert(result.bytes_copied == 100 + 101 + 102 + 103);
  assert(result.errors.size() == 1);
  assert(result.errors[0].code == error_code::kCopyFailed);
  assert(f.Logged(error_code::kCopyFailed));

  assert((progress == std::vector<int32_t>{20, 40, 60, 80, 100}));
  for (const auto& item : result.copied) {
    assert(fs::file_size(item.destination) == fs::file_size(item.source));
  }
}

void TestCopyStopsBetweenFiles() {
  Fixture f("stop");

  std::vector<CopyItem> items;
  for (int i = 0; i < 5; ++i) {
    const auto source = f.Write("src/" + std::to_string(i), "data");
    items.push_back({source, f.root / "dst" / source.filename()});
  }

  ExecutionEngine engine(f.log_sink, Plenty, 1);
  bool            stop   = false;
  auto            result = engine.CopyFiles(
      f.job_id, items, [&](int32_t progress) { stop = progress >= 40; }, [&] { return stop; });

  assert(result.aborted);
  assert(!result.success);
  assert(result.files_processed == 2);
  assert(!fs::exists(f.root / "dst" / "2"));
}

void TestCopyStopsInsideLargeFile() {
  Fixture f("stop_large");

  const auto source = f.Write("src/large.bin", std::string(3 * 1024 * 1024, 'z'));
  const auto target = f.root / "dst" / "large.bin";

  ExecutionEngine engine(f.log_sink, Plenty, 1);
  int             checks = 0;
  // the first check is before the file, the next ones between its chunks
  auto result = engine.CopyFiles(f.job_id, {CopyItem{source, target}}, {}, [&] { return ++checks > 2; });

  assert(result.aborted);
  assert(!result.success);
  assert(result.files_processed == 0);
  assert(result.errors.empty());
  assert(checks == 3);
  assert(!fs::exists(target));
}

void TestFullVerificationDetectsMismatch() {
  Fixture f("verify");

  std::vector<CopyItem> items;
  for (int i = 0; i < 3; ++i) {
    const auto source = f.Write("src/" + std::to_string(i), "0123456789");
    const auto dest   = f.Write("dst/" + std::to_string(i), "0123456789");
    items.push_back({source, dest});
  }

  ExecutionEngine    engine(f.log_sink, Plenty, 1);
  VerificationConfig full{VerificationStrategy::kFull, 20.0, 10};

  auto ok = engine.VerifyFiles(f.job_id, items, full);
  assert(ok.success);
  assert(ok.verified == 3);
  assert(ok.skipped == 0);

  f.Write("dst/1", "01234");
  fs::remove(items[2].destination);

  auto bad = engine.VerifyFiles(f.job_id, items, full);
  assert(!bad.success);
  assert(bad.verified == 1);
  assert(bad.failed == 2);
  assert(bad.errors[0].code == error_code::kSizeMismatch || bad.errors[1].code == error_code::kSizeMismatch);
  assert(f.Logged(error_code::kSizeMismatch));
  assert(f.Logged("ENOENT"));
}

void TestSamplingChecksTwentyPercent() {
  Fixture f("sampling");

  std::vector<CopyItem> items;
  items.reserve(1000);
  for (int i = 0; i < 1000; ++i) {
    const auto name = std::to_string(i);
    items.push_back({f.Write("src/" + name, "x"), f.Write("dst/" + name, "x")});
  }

  ExecutionEngine engine(f.log_sink, Plenty, 42);
  auto            result = engine.VerifyFiles(f.job_id, items, VerificationConfig{});

  assert(result.success);
  assert(result.verified == 200);
  assert(result.failed == 0);
  assert(result.skipped == 800);
}

void TestSizingHelpers() {
  using usbforge::execution::FormatBytes;
  using usbforge::execution::SampleSize;

  assert(FormatBytes(0) == "0 Bytes");
  assert(FormatBytes(512) == "512 Bytes");
  assert(FormatBytes(1536) == "1.5 KB");
  assert(FormatBytes(1ull << 30) == "1 GB");

  VerificationConfig sampling;
  assert(SampleSize(0, sampling) == 0);
  assert(SampleSize(5, sampling) == 5);
  assert(SampleSize(30, sampling) == 10);
  assert(SampleSize(1000, sampling) == 200);
  assert(SampleSize(1001, sampling) == 201);

  VerificationConfig full{VerificationStrategy::kFull, 20.0, 10};
  assert(SampleSize(1000, full) == 1000);
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestManifestPlanResolution() {
  Fixture f("manifest");
  f.Write("plans/order.yaml", "files:\n"
                              "  - source: /library/a.mp3\n"
                              "    target: Music/a.mp3\n"
                              "  - /library/b.mp3\n"
                              "  - tracks/c.mp3\n");

  const auto media = (f.root / "media").lexically_normal();
  usbforge::execution::ManifestPlanResolver resolver(f.root / "plans", f.root / "media");

  usbforge::model::Job job;
  job.id               = f.job_id;
  job.job_token        = "token-1";
  job.volume_label     = "USB-1001";
  job.content_plan_ref = "order.yaml";

  auto plan = resolver.Resolve(job);
  assert(plan.destination_root == media / "USB-1001");
  assert(plan.items.size() == 3);
  assert(plan.items[0].source == fs::path("/library/a.mp3"));
  assert(plan.items[0].destination == plan.destination_root / "Music/a.mp3");
  assert(plan.items[1].destination == plan.destination_root / "b.mp3");
  assert(plan.items[2].source == (f.root / "plans" / "tracks" / "c.mp3").lexically_normal());
  assert(plan.items[2].destination == plan.destination_root / "c.mp3");

  job.assigned_device_id = "sdb";
  assert(resolver.Resolve(job).destination_root == media / "sdb");

  f.Write("plans/escape.yaml", "files:\n  - source: /library/a.mp3\n    target: ../../etc/passwd\n");
  job.content_plan_ref = "escape.yaml";
  assert(Throws<usbforge::util::InvalidArgument>([&] { resolver.Resolve(job); }));

  job.content_plan_ref = "missing.yaml";
  assert(Throws<usbforge::util::NotFound>([&] { resolver.Resolve(job); }));

  job.content_plan_ref.reset();
  assert(Throws<usbforge::util::InvalidArgument>([&] { resolver.Resolve(job); }));
}

void TestManifestDestinationStaysUnderRoot() {
  Fixture f("manifest_root");
  const auto media = (f.root / "media").lexically_normal();
  usbforge::execution::ManifestPlanResolver resolver(f.root / "plans", f.root / "media");

  usbforge::model::Job job;
  job.id        = f.job_id;
  job.job_token = "token-2";

  f.Write("plans/relative.yaml", "destination: usb7\nfiles:\n  - /library/a.mp3\n");
  job.content_plan_ref = "relative.yaml";
  assert(resolver.Resolve(job).destination_root == media / "usb7");

  f.Write("plans/inside.yaml", "destination: " + (media / "usb8").string() + "\nfiles:\n  - /library/a.mp3\n");
  job.content_plan_ref = "inside.yaml";
  assert(resolver.Resolve(job).destination_root == media / "usb8");

  for (const std::string destination : {"/etc", "../outside", "usb7/../..", "."}) {
    f.Write("plans/outside.yaml", "destination: \"" + destination + "\"\nfiles:\n  - /library/a.mp3\n");
    job.content_plan_ref = "outside.yaml";
    assert(Throws<usbforge::util::InvalidArgument>([&] { resolver.Resolve(job); }));
  }

  f.Write("plans/default.yaml", "files:\n  - /library/a.mp3\n");
  job.content_plan_ref = "default.yaml";
  job.volume_label     = "../../home";
  assert(Throws<usbforge::util::InvalidArgument>([&] { resolver.Resolve(job); }));
}

} // namespace

int main() {
  TestValidationClassifiesFiles();
  TestSpaceCheck();
  TestCopyReportsProgressAndKeepsGoing();
  TestCopyStopsBetweenFiles();
  TestCopyStopsInsideLargeFile();
  TestFullVerificationDetectsMismatch();
  TestSamplingChecksTwentyPercent();
  TestSizingHelpers();
  TestManifestPlanResolution();
  TestManifestDestinationStaysUnderRoot();

  std::cout << "usbforge_unit_execution_engine: pass\n";
  return 0;
}
