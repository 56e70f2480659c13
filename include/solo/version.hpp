#ifndef SOLO_VERSION_HPP
#define SOLO_VERSION_HPP

#include <string>

namespace solo {

const std::string SOLO_VERSION_STRING = "1.0.0";
const int SOLO_VERSION_MAJOR = 1;
const int SOLO_VERSION_MINOR = 0;
const int SOLO_VERSION_PATCH = 0;

} // namespace solo

#endif // SOLO_VERSION_HPP
