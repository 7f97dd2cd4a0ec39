#pragma once
#include <tentacle/schema/primitives.hpp>
#include <cstdint>

// Schema type: claim type config.
// Lock workflow: per claim-type issuance settings: the derivative contract
// and the three helper-selection flags. A null derivative contract means the
// claim type is unconfigured.
namespace tentacle::schema {

template <uint16_t Version>
struct claim_type_config;

template <>
struct claim_type_config<1> final {
  uint16_t version{1};
  bool has_default_helper{};
  bool force_default{};
  bool revert_if_default_forced_and_overridden{};
  address_t derivative_contract{};

  bool operator==(const claim_type_config&) const = default;
};

using claim_type_config_t = claim_type_config<1>;

inline bool is_configured(const claim_type_config_t& config) {
  return !is_null(config.derivative_contract);
}

}  // namespace tentacle::schema
