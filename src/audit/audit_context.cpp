#include "et/audit/audit_context.h"

#include <utility>

namespace et::audit {

AuditContext::AuditContext(std::string component_name) {
  state_.component_name = std::move(component_name);
}

void AuditContext::BeginSession(std::optional<std::string> role,
                                std::optional<std::string> staff_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.role = std::move(role);
  state_.staff_id = std::move(staff_id);
}

void AuditContext::EndSession() {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.role.reset();
  state_.staff_id.reset();
}

void AuditContext::SetRole(std::optional<std::string> role) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.role = std::move(role);
}

void AuditContext::SetStaffId(std::optional<std::string> staff_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.staff_id = std::move(staff_id);
}

void AuditContext::SetComponentName(std::string component_name) {
  std::lock_guard<std::mutex> guard(mutex_);
  state_.component_name = std::move(component_name);
}

AuditSnapshot AuditContext::Snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

std::shared_ptr<AuditContext> SharedAuditContext() {
  static const std::shared_ptr<AuditContext> instance = std::make_shared<AuditContext>();
  return instance;
}

} // namespace et::audit
