#include "internal/execution/content_plan.hpp"

#include <yaml-cpp/yaml.h>

#include "internal/util/errors.hpp"

namespace usbforge::execution {

namespace fs = std::filesystem;

namespace {

// Resolves path against root and requires the result to stay strictly below it.
fs::path InsideRoot(const fs::path& root, const fs::path& path, const std::string& what) {
  const fs::path base     = root.lexically_normal();
  const fs::path resolved = (base / path).lexically_normal();
  const fs::path relative = resolved.lexically_relative(base);
  if (relative.empty() || relative == "." || *relative.begin() == "..") {
    throw util::InvalidArgument(what + " escapes " + (base.empty() ? std::string(".") : base.string()) + ": " + path.string());
  }
  return resolved;
}

fs::path DefaultVolumeName(const model::Job& job) {
  if (job.assigned_device_id && !job.assigned_device_id->empty()) return *job.assigned_device_id;
  if (!job.volume_label.empty()) return job.volume_label;
  return job.job_token;
}

// Keeps targets inside the volume root.
fs::path SafeTarget(const std::string& target) {
  fs::path relative = fs::path(target).lexically_normal().relative_path();
  if (relative.empty() || *relative.begin() == "..") {
    throw util::InvalidArgument("manifest target escapes the volume: " + target);
  }
  return relative;
}

} // namespace

ManifestPlanResolver::ManifestPlanResolver(fs::path manifest_dir, fs::path destination_root)
    : manifest_dir_(std::move(manifest_dir)), destination_root_(std::move(destination_root)) {
}

ContentPlan ManifestPlanResolver::Resolve(const model::Job& job) {
  if (!job.content_plan_ref || job.content_plan_ref->empty()) {
    throw util::InvalidArgument("job " + std::to_string(job.id) + " has no content plan");
  }

  fs::path manifest = *job.content_plan_ref;
  if (manifest.is_relative()) manifest = manifest_dir_ / manifest;
  if (!fs::exists(manifest)) {
    throw util::NotFound("content plan not found: " + manifest.string());
  }

  try {
    YAML::Node root = YAML::LoadFile(manifest.string());

    ContentPlan plan;
    plan.destination_root = root["destination"]
                                ? InsideRoot(destination_root_, root["destination"].as<std::string>(), "manifest destination")
                                : InsideRoot(destination_root_, DefaultVolumeName(job), "volume");

    // relative sources are read from beside the manifest
    const fs::path source_dir = manifest.parent_path();
    auto           source_of  = [&](const std::string& source) {
      fs::path path(source);
      return path.is_relative() ? (source_dir / path).lexically_normal() : path;
    };

    const YAML::Node files = root["files"];
    if (!files || !files.IsSequence()) {
      throw util::InvalidArgument("content plan " + manifest.string() + " has no files list");
    }

    for (const auto& file : files) {
      CopyItem item;
      if (file.IsScalar()) {
        item.source = source_of(file.as<std::string>());
        item.destination = plan.destination_root / item.source.filename();
      } else {
        if (!file["source"]) throw util::InvalidArgument("content plan entry without source in " + manifest.string());
        item.source = source_of(file["source"].as<std::string>());
        item.destination = plan.destination_root / (file["target"] ? SafeTarget(file["target"].as<std::string>())
                                                                   : item.source.filename());
      }
      plan.items.push_back(std::move(item));
    }
    return plan;
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("invalid content plan " + manifest.string() + ": " + e.what());
  }
}

} // namespace usbforge::execution
