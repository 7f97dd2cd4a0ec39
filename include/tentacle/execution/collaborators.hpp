#pragma once

#include <tentacle/schema/primitives.hpp>
#include <functional>
#include <map>
#include <vector>

namespace tentacle::execution {

/// Staking registry the lock engine sits behind. `identity` is the only
/// caller accepted on the registration/redemption hooks.
struct staking_authority_t final {
  tentacle::schema::address_t identity{};
  std::function<tentacle::schema::amount_t(tentacle::schema::position_id_t)>
      staking_token_balance;
  std::function<tentacle::schema::address_t(tentacle::schema::position_id_t)>
      lock_manager;
  std::function<bool(const tentacle::schema::address_t& caller,
                     tentacle::schema::position_id_t position_id)>
      is_approved_or_owner;
};

/// Derivative token capabilities for one claim type.
struct derivative_contract_t final {
  std::function<void(const tentacle::schema::address_t& to,
                     const tentacle::schema::amount_t& amount)>
      mint;
  std::function<void(const tentacle::schema::address_t& caller,
                     const tentacle::schema::address_t& from,
                     const tentacle::schema::amount_t& amount)>
      burn;
};

/// Issuance helper: receives freshly minted supply and distributes it.
struct helper_module_t final {
  std::function<void(
      tentacle::schema::claim_type_id_t claim_type_id,
      const tentacle::schema::address_t& derivative_contract,
      const std::vector<tentacle::schema::position_id_t>& position_ids,
      const tentacle::schema::amount_t& amount,
      const tentacle::schema::address_t& beneficiary)>
      create_for;
};

/// Address book resolving configured addresses to their capabilities.
///
/// Claim-type configuration stores addresses only; the engine looks the
/// implementation up here at call time, so re-pointing a claim type to a
/// different address takes effect immediately.
class contract_directory final {
 public:
  void register_derivative(const tentacle::schema::address_t& address,
                           derivative_contract_t contract);
  void register_helper(const tentacle::schema::address_t& address,
                       helper_module_t helper);

  const derivative_contract_t* find_derivative(
      const tentacle::schema::address_t& address) const;
  const helper_module_t* find_helper(
      const tentacle::schema::address_t& address) const;

 private:
  std::map<tentacle::schema::address_t, derivative_contract_t> derivatives_;
  std::map<tentacle::schema::address_t, helper_module_t> helpers_;
};

}  // namespace tentacle::execution
