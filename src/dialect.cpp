#include "lazycsv/dialect.h"

#include <cstdio>
#include <sstream>

namespace lazycsv {

std::string Dialect::to_string() const {
  std::ostringstream ss;
  ss << "Dialect{delimiter=";

  switch (delimiter) {
  case '\t':
    ss << "'\\t'";
    break;
  default:
    if (delimiter >= 32 && delimiter < 127) {
      ss << "'" << delimiter << "'";
    } else {
      char hex[8];
      std::snprintf(hex, sizeof(hex), "'\\x%02x'", static_cast<unsigned char>(delimiter));
      ss << hex;
    }
    break;
  }

  ss << ", quote='\"'}";
  return ss.str();
}

} // namespace lazycsv
