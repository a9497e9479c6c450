#pragma once

#include <string>

#include "gimba/core/artifact_store.hpp"

namespace gimba::core {

// TextFileSink on the local file system. Missing parent directories are
// created on write.
class LocalTextFileSink final : public TextFileSink {
 public:
  [[nodiscard]] bool Exists(const std::string& path) const override;
  FileWriteResult Write(const std::string& path, const std::string& content, bool overwrite) override;
};

}  // namespace gimba::core
