#pragma once

#include <tentacle/schema/claim_type_config.hpp>
#include <tentacle/schema/lock_error_code.hpp>
#include <tentacle/schema/primitives.hpp>
#include <optional>

namespace tentacle::execution {

/// Outcome of helper selection. When `error` is set no helper applies and
/// the call must be rejected; otherwise `helper` may still be empty, meaning
/// supply goes straight to the beneficiary.
struct helper_resolution_t final {
  std::optional<tentacle::schema::address_t> helper;
  std::optional<tentacle::schema::lock_error_code> error;
};

/// Pick the helper for one create.
///
/// Decision table (evaluated in order):
/// 1. no default helper configured: use the override (may be none);
/// 2. default forced, or no override supplied: use the default, unless
///    `revert_if_default_forced_and_overridden` is set and an override that
///    differs from the default was supplied, which is a
///    `default_helper_conflict`;
/// 3. otherwise the override wins.
///
/// Null addresses are treated as absent for both inputs.
helper_resolution_t resolve_helper(
    const tentacle::schema::claim_type_config_t& config,
    const std::optional<tentacle::schema::address_t>& helper_override,
    const std::optional<tentacle::schema::address_t>& default_helper);

}  // namespace tentacle::execution
