#pragma once

#include <string>

namespace logship::trigger {

/*
  Where stored-object notifications are read from.

  Fetch() returns the raw object body (possibly gzip); throws
  util::NotFound when the object does not exist.
*/
class ObjectSource {
 public:
  virtual ~ObjectSource() = default;

  virtual std::string Fetch(const std::string& bucket, const std::string& key) = 0;
};

} // namespace logship::trigger
