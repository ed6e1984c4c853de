#pragma once

#include <stdexcept>
#include <string>

namespace tether {

class SessionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Unusable TTL or storage location at construction time.
class ConfigurationError : public SessionError {
 public:
  using SessionError::SessionError;
};

class InvalidArgument : public SessionError {
 public:
  using SessionError::SessionError;
};

class SessionNotFound : public SessionError {
 public:
  using SessionError::SessionError;
};

// requestType present with an unknown value, or alongside other fields.
class MalformedSessionRequest : public SessionError {
 public:
  using SessionError::SessionError;
};

class SessionsDisabled : public SessionError {
 public:
  using SessionError::SessionError;
};

// Key rejected by the session path sanitizer.
class InvalidSessionKey : public SessionError {
 public:
  using SessionError::SessionError;
};

// Removing a session whose directory is already gone.
class InvalidSessionState : public SessionError {
 public:
  using SessionError::SessionError;
};

class SessionStorageError : public SessionError {
 public:
  using SessionError::SessionError;
};

// Body that cannot be parsed or lacks what the inference handler needs.
class InvalidRequest : public SessionError {
 public:
  using SessionError::SessionError;
};

}  // namespace tether
