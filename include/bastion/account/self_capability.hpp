#pragma once

namespace bastion::account {

class account;

/// Proof that the current call reached an account from its own identity.
/// Only `account` can mint one, and only on its self-call path, so
/// configuration changes can only follow a request the account itself
/// authorized and forwarded to itself.
class self_capability final {
 public:
  self_capability(const self_capability&) = delete;
  self_capability& operator=(const self_capability&) = delete;
  self_capability(self_capability&&) = default;

 private:
  friend class account;
  self_capability() = default;
};

}  // namespace bastion::account
