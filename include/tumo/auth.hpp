#ifndef TUMO_AUTH_HPP
#define TUMO_AUTH_HPP

#include <unordered_map>
#include <optional>

#include "types.hpp"

namespace tumo {

// =============================================================================
// Capability Token
// =============================================================================

// Opaque proof of role. Only the registry that minted it can vouch for it.
struct Capability {
    uint64_t id;
    Role role;
};

// =============================================================================
// CapabilityRegistry - Who holds which role token
// =============================================================================

class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    // Mint a new token of `role` held by `holder`
    Capability mint(Role role, const Address& holder);

    // Token is registered, carries `role`, and is held by `caller`
    bool verify(const Capability& cap, Role role, const Address& caller) const;

    // UNAUTHORIZED unless `from` currently holds `cap`
    int32_t transfer(const Capability& cap, const Address& from, const Address& to);

    std::optional<Address> holder_of(const Capability& cap) const;

    // First token of `role` held by `holder`
    std::optional<Capability> find(const Address& holder, Role role) const;

private:
    struct Entry {
        Role role;
        Address holder;
    };
    std::unordered_map<uint64_t, Entry> entries_;
    uint64_t next_id_ = 1;
};

} // namespace tumo

#endif // TUMO_AUTH_HPP
