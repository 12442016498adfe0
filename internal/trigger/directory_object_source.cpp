#include "directory_object_source.hpp"

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace logship::trigger {
namespace {

bool IsSafeRelative(const std::filesystem::path& path) {
  if (path.empty() || path.is_absolute() || path.has_root_name()) {
    return false;
  }
  for (const auto& part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

} // namespace

DirectoryObjectSource::DirectoryObjectSource(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path DirectoryObjectSource::ResolvePath(const std::string& bucket, const std::string& key) const {
  const std::filesystem::path bucket_path(bucket);
  const std::filesystem::path key_path(key);

  if (!IsSafeRelative(bucket_path) || !IsSafeRelative(key_path)) {
    throw util::NotFound("refusing object path s3://" + bucket + "/" + key);
  }
  return root_ / bucket_path / key_path;
}

std::string DirectoryObjectSource::Fetch(const std::string& bucket, const std::string& key) {
  const auto path = ResolvePath(bucket, key);

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("object s3://" + bucket + "/" + key + " not found under " + root_.string());
  }

  std::ostringstream body;
  body << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("failed to read " + path.string());
  }
  return body.str();
}

} // namespace logship::trigger
