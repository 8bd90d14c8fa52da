#pragma once

#include <functional>
#include <string>
#include <utility>

namespace pv::orchestrator {

// Device authentication (biometric or passcode) provided by the host.
class AuthorizationGate {
public:
  virtual ~AuthorizationGate() = default;
  virtual bool Authorize(const std::string& reason) = 0;
};

// Adapts a callable; used by hosts without a dedicated gate object and by tests.
class CallbackAuthorizationGate : public AuthorizationGate {
public:
  using Callback = std::function<bool(const std::string&)>;

  explicit CallbackAuthorizationGate(Callback callback) : callback_(std::move(callback)) {}

  bool Authorize(const std::string& reason) override { return callback_ && callback_(reason); }

private:
  Callback callback_;
};

}  // namespace pv::orchestrator
