#pragma once

#include <stdexcept>
#include <string>

namespace hashtax::util {

/*
  Central error types.

  The merge / LCA / summary core never throws; these are raised by the
  table and taxonomy readers and translated to exit codes by the CLI.
*/

class FileNotFound : public std::runtime_error {
 public:
  explicit FileNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingColumn : public std::runtime_error {
 public:
  explicit MissingColumn(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EmptyInput : public std::runtime_error {
 public:
  explicit EmptyInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedInputFormat : public std::runtime_error {
 public:
  explicit UnsupportedInputFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedOutputFormat : public std::runtime_error {
 public:
  explicit UnsupportedOutputFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MixedInputFormats : public std::runtime_error {
 public:
  explicit MixedInputFormats(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoValidInputFiles : public std::runtime_error {
 public:
  explicit NoValidInputFiles(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace hashtax::util
