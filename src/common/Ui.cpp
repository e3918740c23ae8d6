#include "common/Ui.hpp"

#include <iostream>

namespace ldp::common {

ConsoleUi::ConsoleUi() : _osOut(std::cout) {}

ConsoleUi::ConsoleUi(std::ostream& osOut) : _osOut(osOut) {}

ConsoleUi::~ConsoleUi() = default;

void ConsoleUi::write(const std::string& sMessage) {
  _osOut << sMessage;
  _osOut.flush();
}

}  // namespace ldp::common
