#ifndef JCX_DIVAN_ACCESSOR_CONFIG_H
#define JCX_DIVAN_ACCESSOR_CONFIG_H

#include <cstdint>

#include "jcailloux/divan/io/store/ViewQuery.h"

namespace jcailloux::divan::config {

    // =========================================================================
    // Provisioning mode - how resolve-or-create of views is serialized
    // =========================================================================
    enum class ProvisioningMode : uint8_t {
        Unguarded,  // read-modify-upsert races between concurrent first resolutions
        Guarded     // resolve-or-create runs under an io::AsyncMutex
    };

    // =========================================================================
    // AccessorConfig - structural aggregate for NTTP usage
    // =========================================================================
    //
    // Usage:
    //   using Accounts = Accessor<Account, "Account">;                  // Default
    //   using Accounts = Accessor<Account, "Account", config::Guarded>; // preset
    //   using Accounts = Accessor<Account, "Account",
    //       config::Default.with_stale(io::Stale::Ok).with_read_only()>; // customized
    //

    struct AccessorConfig {
        io::Stale stale = io::Stale::False;
        ProvisioningMode provisioning = ProvisioningMode::Unguarded;
        bool read_only = false;

        consteval AccessorConfig with_stale(io::Stale v) const { auto c = *this; c.stale = v; return c; }
        consteval AccessorConfig with_provisioning(ProvisioningMode v) const { auto c = *this; c.provisioning = v; return c; }
        consteval AccessorConfig with_read_only(bool v = true) const { auto c = *this; c.read_only = v; return c; }

        constexpr auto operator<=>(const AccessorConfig&) const = default;
    };

    // =========================================================================
    // Presets
    // =========================================================================

    /// Up-to-date finder results, unguarded provisioning.
    inline constexpr AccessorConfig Default{};

    /// Resolve-or-create serialized across every guarded accessor of the same
    /// store in this process. Use when several threads or accessors may
    /// rebuild their views at the same time.
    inline constexpr AccessorConfig Guarded{ .provisioning = ProvisioningMode::Guarded };

    /// Reads and finders only; mutating operations do not compile.
    inline constexpr AccessorConfig ReadOnly{ .read_only = true };

}  // namespace jcailloux::divan::config

#endif  // JCX_DIVAN_ACCESSOR_CONFIG_H
