// common/errors.hpp
#pragma once
// All comments are in English.

#include <stdexcept>
#include <string>

namespace bdl {

// Blob magic mismatch or a tensor record that does not fit the remaining blob.
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// A tensor would decode past the fixed scratch buffer.
class OverrunError : public std::runtime_error {
public:
  explicit OverrunError(const std::string& what) : std::runtime_error(what) {}
};

// Flash response never arrived within the wait budget.
class ProtocolHang : public std::runtime_error {
public:
  explicit ProtocolHang(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bdl
