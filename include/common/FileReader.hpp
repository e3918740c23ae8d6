#pragma once

#include <string>

namespace ldp::common {

/// Local file access used by the build and plan stages.
class IFileReader {
 public:
  virtual ~IFileReader() = default;

  /// Whole file as bytes. Throws common::NotFoundError when it cannot be read.
  virtual std::string readFile(const std::string& sPath) = 0;
};

/// Reads from the local filesystem in binary mode.
/// Class abbreviation: lfr
class LocalFileReader : public IFileReader {
 public:
  LocalFileReader();
  ~LocalFileReader() override;

  std::string readFile(const std::string& sPath) override;
};

}  // namespace ldp::common
