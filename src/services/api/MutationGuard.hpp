#pragma once
#include <string>

namespace httplib { struct Request; }

namespace jds {

// Decides, before dispatch, whether POST/PUT/DELETE are switched off
// for this request.
class MutationGuard {
public:
  virtual ~MutationGuard() = default;
  virtual bool mutationsDisabled(const httplib::Request& req) const = 0;
};

class AllowAllGuard : public MutationGuard {
public:
  bool mutationsDisabled(const httplib::Request&) const override { return false; }
};

// Production when the environment marker is "production" and, if a header
// value is configured, the request's client header carries that value.
class ProductionGate : public MutationGuard {
public:
  ProductionGate(std::string environment, std::string headerName, std::string headerValue);

  bool mutationsDisabled(const httplib::Request& req) const override;

private:
  bool production_;
  std::string headerName_;
  std::string headerValue_;
};

} // namespace jds
