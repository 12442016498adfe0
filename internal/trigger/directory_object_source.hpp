#pragma once

#include <filesystem>
#include <string>

#include "internal/trigger/object_source.hpp"

namespace logship::trigger {

/*
  Serves objects from a local tree laid out as <root>/<bucket>/<key>.

  Keys that would escape the bucket directory ("..", absolute paths)
  are refused.
*/
class DirectoryObjectSource final : public ObjectSource {
 public:
  explicit DirectoryObjectSource(std::filesystem::path root);

  std::string Fetch(const std::string& bucket, const std::string& key) override;

 private:
  std::filesystem::path ResolvePath(const std::string& bucket, const std::string& key) const;

  std::filesystem::path root_;
};

} // namespace logship::trigger
