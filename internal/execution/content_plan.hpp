#pragma once

#include <filesystem>
#include <vector>

#include "internal/execution/types.hpp"
#include "internal/model/job.hpp"

namespace usbforge::execution {

// Files to put on the volume for one job.
struct ContentPlan {
  std::filesystem::path destination_root;
  std::vector<CopyItem> items;
};

/*
  Maps a job to its file list. Content selection itself happens
  upstream; resolvers only read what was decided.
*/
class ContentPlanResolver {
 public:
  virtual ~ContentPlanResolver() = default;

  // Throws util::NotFound / util::InvalidArgument when the plan is missing or malformed.
  virtual ContentPlan Resolve(const model::Job& job) = 0;
};

/*
  Reads the plan from a YAML manifest named by job.content_plan_ref
  (relative refs resolve against manifest_dir):

    destination: usb0             # optional
    files:
      - source: /library/music/a.mp3
        target: Music/a.mp3       # optional, default file name

  Without a destination the volume root is
  destination_root / (assigned_device_id | volume_label | job_token).
  A relative destination resolves against destination_root, and either
  form must stay below it. Relative sources resolve against the
  manifest's directory.
*/
class ManifestPlanResolver final : public ContentPlanResolver {
 public:
  ManifestPlanResolver(std::filesystem::path manifest_dir, std::filesystem::path destination_root);

  ContentPlan Resolve(const model::Job& job) override;

 private:
  std::filesystem::path manifest_dir_;
  std::filesystem::path destination_root_;
};

} // namespace usbforge::execution
