// =============================================================================
// auth.cpp - Capability registry
// =============================================================================

#include "tumo/auth.hpp"

namespace tumo {

Capability CapabilityRegistry::mint(Role role, const Address& holder) {
    uint64_t id = next_id_++;
    entries_[id] = Entry{role, holder};
    return Capability{id, role};
}

bool CapabilityRegistry::verify(const Capability& cap, Role role, const Address& caller) const {
    auto it = entries_.find(cap.id);
    if (it == entries_.end()) return false;

    // Role is checked against the registry, not the caller-supplied copy
    return it->second.role == role && cap.role == role && it->second.holder == caller;
}

int32_t CapabilityRegistry::transfer(const Capability& cap, const Address& from, const Address& to) {
    auto it = entries_.find(cap.id);
    if (it == entries_.end() || it->second.role != cap.role || it->second.holder != from) {
        return errors::UNAUTHORIZED;
    }
    it->second.holder = to;
    return errors::OK;
}

std::optional<Address> CapabilityRegistry::holder_of(const Capability& cap) const {
    auto it = entries_.find(cap.id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.holder;
}

std::optional<Capability> CapabilityRegistry::find(const Address& holder, Role role) const {
    std::optional<Capability> found;
    for (const auto& [id, entry] : entries_) {
        if (entry.role != role || entry.holder != holder) continue;
        // Lowest id wins so the answer does not depend on hash order
        if (!found || id < found->id) {
            found = Capability{id, role};
        }
    }
    return found;
}

} // namespace tumo
