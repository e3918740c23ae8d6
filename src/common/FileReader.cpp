#include "common/FileReader.hpp"

#include <fstream>
#include <sstream>

#include "common/Errors.hpp"

namespace ldp::common {

LocalFileReader::LocalFileReader() = default;
LocalFileReader::~LocalFileReader() = default;

std::string LocalFileReader::readFile(const std::string& sPath) {
  std::ifstream ifs(sPath, std::ios::binary);
  if (!ifs) {
    throw NotFoundError("file_not_found", "Unable to open file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) {
    throw NotFoundError("file_read_failed", "Unable to read file: " + sPath);
  }
  return oss.str();
}

}  // namespace ldp::common
