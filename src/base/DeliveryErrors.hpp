#ifndef __FJ_DELIVERY_ERRORS__
#define __FJ_DELIVERY_ERRORS__

#include "Headers.hpp"

namespace fj {
/**
 * @brief Raised for malformed delivery configuration, before any I/O.
 */
class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Raised when the transport accepts no bytes for a hand-off.
 *
 * The connection that produced this error must be discarded.
 */
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const string& what) : std::runtime_error(what) {}
};

/** @brief Raised when a message cannot be serialized into a frame. */
class EncodingError : public std::runtime_error {
 public:
  explicit EncodingError(const string& what) : std::runtime_error(what) {}
};
}  // namespace fj

#endif  // __FJ_DELIVERY_ERRORS__
