#pragma once

#include <stdexcept>
#include <string>

namespace veil {

class ScanError : public std::runtime_error {
 public:
  explicit ScanError(const std::string& what) : std::runtime_error(what) {}
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace veil
