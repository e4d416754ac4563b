#pragma once

#include <cstdint>

// ISession: what the listener needs from an accepted connection regardless
// of its transport (plain or TLS). The session keeps itself alive once
// started.
class ISession {
public:
  virtual ~ISession() = default;
  virtual void Start() = 0;
  virtual std::uint64_t Id() const = 0;
};
