#pragma once

#include <ostream>
#include <string>

namespace ldp::common {

/// Progress sink written to by the executor before annotated instructions.
class IUi {
 public:
  virtual ~IUi() = default;

  virtual void write(const std::string& sMessage) = 0;
};

/// Writes progress messages verbatim to an output stream (stdout by default).
/// Class abbreviation: cu
class ConsoleUi : public IUi {
 public:
  ConsoleUi();
  explicit ConsoleUi(std::ostream& osOut);
  ~ConsoleUi() override;

  void write(const std::string& sMessage) override;

 private:
  std::ostream& _osOut;
};

}  // namespace ldp::common
