#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace et::audit {

  // Value copy of the identity fields, taken once per recorded event.
  struct AuditSnapshot {
    std::optional<std::string> role;
    std::optional<std::string> staff_id;
    std::string component_name;

    friend bool operator==(const AuditSnapshot&, const AuditSnapshot&) = default;
  };

  // Session identity attached to every recorded event. Written by the
  // authentication/session layer, only read by recorders. Each read or write
  // is atomic with respect to the others, so a recorder never observes half
  // of a BeginSession(). // TSK206
  class AuditContext {
  public:
    AuditContext() = default;
    explicit AuditContext(std::string component_name);

    AuditContext(const AuditContext&) = delete;
    AuditContext& operator=(const AuditContext&) = delete;

    void BeginSession(std::optional<std::string> role, std::optional<std::string> staff_id);
    void EndSession();

    void SetRole(std::optional<std::string> role);
    void SetStaffId(std::optional<std::string> staff_id);
    void SetComponentName(std::string component_name);

    AuditSnapshot Snapshot() const;

  private:
    mutable std::mutex mutex_;
    AuditSnapshot state_;
  };

  // Process-wide context shared by recorders that are not given their own.
  std::shared_ptr<AuditContext> SharedAuditContext();

} // namespace et::audit
