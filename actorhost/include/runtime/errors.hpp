#pragma once

#include <stdexcept>
#include <string>

namespace ActorHost::Runtime {

// Failures raised by actor type handlers. The runtime passes them through.
class ActorError : public std::runtime_error {
 public:
  explicit ActorError(const std::string& what) : std::runtime_error(what) {}
};

class ActorNotActivatedError : public ActorError {
 public:
  using ActorError::ActorError;
};

class ActorMethodNotFoundError : public ActorError {
 public:
  using ActorError::ActorError;
};

class ActorNotRemindableError : public ActorError {
 public:
  using ActorError::ActorError;
};

class ActorTimerNotFoundError : public ActorError {
 public:
  using ActorError::ActorError;
};

class PayloadFormatError : public ActorError {
 public:
  using ActorError::ActorError;
};

}  // namespace ActorHost::Runtime
