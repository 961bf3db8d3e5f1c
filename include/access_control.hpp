#pragma once

#include "clock.hpp"
#include "event_log.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lf {

using Address = std::string;

enum class Role : std::uint8_t { Owner, Operator, Distributor, Admin };

const char* toString(Role role);

// Principal -> role set. Entry points ask it for a capability instead of
// inheriting one; unauthorized callers are rejected before any argument is
// looked at.
class AccessControl {
public:
    // The deploying owner starts with every role.
    AccessControl(const Address& owner, const Clock& clock, EventLog& log);

    void grantRole(const Address& caller, const Address& account, Role role);
    void revokeRole(const Address& caller, const Address& account, Role role);

    bool hasRole(const Address& account, Role role) const;
    void requireRole(const Address& account, Role role) const;
    std::vector<Role> rolesOf(const Address& account) const;

private:
    const Clock& clock_;
    EventLog& log_;
    std::unordered_map<Address, std::set<Role>> roles_;
};

} // namespace lf
