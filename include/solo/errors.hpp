#ifndef SOLO_ERRORS_HPP
#define SOLO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace solo {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The claim could not be evaluated at all (not "held elsewhere").
class ClaimError : public Error {
public:
  using Error::Error;
};

// No primary answered on the channel within the connect timeout.
class ConnectError : public Error {
public:
  using Error::Error;
};

// The primary could not bind its channel endpoint.
class ChannelBindError : public Error {
public:
  using Error::Error;
};

// Formats "what: strerror(err)".
std::string errnoMessage(const std::string &what, int err);

} // namespace solo

#endif // SOLO_ERRORS_HPP
