#include "MutationGuard.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace jds {

ProductionGate::ProductionGate(std::string environment,
                               std::string headerName,
                               std::string headerValue)
  : production_(environment == "production"),
    headerName_(std::move(headerName)),
    headerValue_(std::move(headerValue)) {
  if (production_ && headerValue_.empty()) {
    spdlog::warn("production gate armed without a {} value: every POST/PUT/DELETE will be refused",
                 headerName_);
  }
}

bool ProductionGate::mutationsDisabled(const httplib::Request& req) const {
  if (!production_) return false;
  if (headerValue_.empty()) return true;
  return req.get_header_value(headerName_) == headerValue_;
}

} // namespace jds
