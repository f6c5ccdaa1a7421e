#pragma once

#include <stdexcept>
#include <string>

namespace ainp::util {

/*
  Central error types.

  DomainError subclasses are final answers for the requesting agent and
  must not be retried automatically. StoreError means the store rejected
  or lost the transaction; it was rolled back and the caller may retry.
*/

class DomainError : public std::runtime_error {
 public:
  explicit DomainError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public DomainError {
 public:
  explicit NotFound(const std::string& msg) : DomainError(msg) {
  }
};

class NegotiationNotFound : public NotFound {
 public:
  explicit NegotiationNotFound(const std::string& negotiation_id)
      : NotFound("negotiation not found: " + negotiation_id), negotiation_id_(negotiation_id) {
  }

  const std::string& negotiation_id() const {
    return negotiation_id_;
  }

 private:
  std::string negotiation_id_;
};

class AlreadyExists : public DomainError {
 public:
  explicit AlreadyExists(const std::string& msg) : DomainError(msg) {
  }
};

class InvalidStateTransition : public DomainError {
 public:
  InvalidStateTransition(const std::string& from_state, const std::string& action)
      : DomainError("invalid state transition: cannot " + action + " from state " + from_state),
        from_state_(from_state),
        action_(action) {
  }

  explicit InvalidStateTransition(const std::string& msg) : DomainError(msg) {
  }

  const std::string& from_state() const {
    return from_state_;
  }
  const std::string& action() const {
    return action_;
  }

 private:
  std::string from_state_;
  std::string action_;
};

class ExpiredNegotiation : public DomainError {
 public:
  explicit ExpiredNegotiation(const std::string& negotiation_id)
      : DomainError("negotiation expired: " + negotiation_id) {
  }
};

class MaxRoundsExceeded : public DomainError {
 public:
  MaxRoundsExceeded(const std::string& negotiation_id, unsigned max_rounds)
      : DomainError("negotiation " + negotiation_id + " reached max rounds (" + std::to_string(max_rounds) + ")") {
  }
};

class InsufficientCredits : public DomainError {
 public:
  InsufficientCredits(const std::string& agent_did, unsigned long long needed, unsigned long long available)
      : DomainError("insufficient credits for " + agent_did + ": need " + std::to_string(needed) + ", have " +
                    std::to_string(available)) {
  }
};

class ValidationError : public DomainError {
 public:
  explicit ValidationError(const std::string& msg) : DomainError(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ainp::util
