#include "solo/errors.hpp"

#include <cstring>

namespace solo {

std::string errnoMessage(const std::string &what, int err) {
  return what + ": " + std::strerror(err);
}

} // namespace solo
