#include "access_control.hpp"

#include "errors.hpp"

namespace lf {

const char* toString(Role role) {
    switch (role) {
    case Role::Owner: return "owner";
    case Role::Operator: return "operator";
    case Role::Distributor: return "distributor";
    case Role::Admin: return "admin";
    }
    return "unknown";
}

AccessControl::AccessControl(const Address& owner, const Clock& clock, EventLog& log)
    : clock_(clock)
    , log_(log) {
    if (owner.empty()) {
        throw std::invalid_argument("AccessControl requires a non-empty owner");
    }
    roles_[owner] = { Role::Owner, Role::Operator, Role::Distributor, Role::Admin };
}

void AccessControl::grantRole(const Address& caller, const Address& account, Role role) {
    requireRole(caller, Role::Owner);
    if (account.empty()) {
        throw LottoError(ErrorCode::InvalidAddress, "cannot grant a role to an empty address");
    }
    if (!roles_[account].insert(role).second) {
        return;
    }
    log_.append(clock_.now(), "role-granted",
                EventFields().add("account", account).add("role", toString(role)).add("by", caller));
}

void AccessControl::revokeRole(const Address& caller, const Address& account, Role role) {
    requireRole(caller, Role::Owner);
    auto it = roles_.find(account);
    if (it == roles_.end() || it->second.erase(role) == 0) {
        return;
    }
    log_.append(clock_.now(), "role-revoked",
                EventFields().add("account", account).add("role", toString(role)).add("by", caller));
}

bool AccessControl::hasRole(const Address& account, Role role) const {
    auto it = roles_.find(account);
    return it != roles_.end() && it->second.count(role) != 0;
}

void AccessControl::requireRole(const Address& account, Role role) const {
    if (!hasRole(account, role)) {
        throw LottoError(ErrorCode::Unauthorized,
                         "'" + account + "' lacks the " + toString(role) + " role");
    }
}

std::vector<Role> AccessControl::rolesOf(const Address& account) const {
    auto it = roles_.find(account);
    if (it == roles_.end()) {
        return {};
    }
    return std::vector<Role>(it->second.begin(), it->second.end());
}

} // namespace lf
