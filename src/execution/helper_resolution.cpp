#include <tentacle/execution/helper_resolution.hpp>

namespace tentacle::execution {

namespace {

std::optional<tentacle::schema::address_t> non_null(
    const std::optional<tentacle::schema::address_t>& address) {
  if (!address || tentacle::schema::is_null(*address)) {
    return std::nullopt;
  }
  return address;
}

}  // namespace

helper_resolution_t resolve_helper(
    const tentacle::schema::claim_type_config_t& config,
    const std::optional<tentacle::schema::address_t>& helper_override,
    const std::optional<tentacle::schema::address_t>& default_helper) {
  const auto override_helper = non_null(helper_override);
  const auto fallback = non_null(default_helper);

  if (!config.has_default_helper) {
    return helper_resolution_t{.helper = override_helper};
  }

  if (config.force_default || !override_helper) {
    // An override equal to the default is not a divergence.
    if (config.revert_if_default_forced_and_overridden && override_helper &&
        override_helper != fallback) {
      return helper_resolution_t{
          .helper = std::nullopt,
          .error = tentacle::schema::lock_error_code::default_helper_conflict};
    }
    return helper_resolution_t{.helper = fallback};
  }

  return helper_resolution_t{.helper = override_helper};
}

}  // namespace tentacle::execution
