#ifndef TRUST_DOT_HPP
#define TRUST_DOT_HPP

#include "Matrix.hpp"

enum class trust { trusted, untrusted };

// Decides which recipient devices get a room's keys.  The keys handed
// in have already passed their self-signature check.
class TrustPolicy {
public:
  virtual ~TrustPolicy() = default;

  virtual trust decide(Matrix::DeviceKeys const& device) const = 0;
};

// No verification: every device is trusted.
class TrustEveryone : public TrustPolicy {
public:
  trust decide(Matrix::DeviceKeys const&) const override
  {
    return trust::trusted;
  }
};

#endif // TRUST_DOT_HPP
