#pragma once

#include <tentacle/execution/collaborators.hpp>
#include <tentacle/execution/state_frame.hpp>
#include <tentacle/schema/call_result.hpp>
#include <tentacle/schema/claim_bitmap.hpp>
#include <tentacle/schema/claim_instruction.hpp>
#include <tentacle/schema/claim_type_config.hpp>
#include <tentacle/schema/encoding/encoder.hpp>
#include <tentacle/schema/encoding/scale/encoder.hpp>
#include <tentacle/schema/lock_error_code.hpp>
#include <tentacle/schema/primitives.hpp>
#include <tentacle/schema/query_result.hpp>
#include <tentacle/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tentacle::execution {

/// Identities the engine needs besides the staking authority.
struct engine_options final {
  /// Address of this lock manager as the staking authority knows it.
  tentacle::schema::address_t self{};
  /// Only caller allowed to configure claim types.
  tentacle::schema::address_t administrator{};
};

/// Lock manager mediating derivative claims against staked positions.
///
/// Every mutating entry point runs to completion inside its own write frame
/// and either commits all of its changes or none. Collaborators may call back
/// into the engine while an entry point is in flight; those nested calls see
/// the outer call's pending writes.
class engine final {
 public:
  using encoder_t = tentacle::schema::encoding::encoder<
      tentacle::schema::encoding::scale_encoder_tag>;
  using storage_t =
      tentacle::storage::storage<tentacle::storage::rocksdb_storage_tag>;

  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  staking_authority_t authority,
                  contract_directory& directory,
                  engine_options options);

  /// Store the configuration and default helper for a claim type.
  ///
  /// Overwrites any earlier configuration without a transition period.
  tentacle::schema::call_result_t configure(
      const tentacle::schema::address_t& caller,
      tentacle::schema::claim_type_id_t claim_type_id,
      const tentacle::schema::claim_type_config_t& config,
      const std::optional<tentacle::schema::address_t>& default_helper);

  /// Create one claim for a position on behalf of its owner or approved
  /// operator, issuing the position's current balance.
  tentacle::schema::call_result_t create(
      const tentacle::schema::address_t& caller,
      tentacle::schema::claim_type_id_t claim_type_id,
      tentacle::schema::position_id_t position_id,
      const tentacle::schema::address_t& beneficiary,
      const std::optional<tentacle::schema::address_t>& helper_override);

  /// Destroy one outstanding claim, retiring the position's current balance
  /// from `from`.
  tentacle::schema::call_result_t destroy(
      const tentacle::schema::address_t& caller,
      tentacle::schema::claim_type_id_t claim_type_id,
      tentacle::schema::position_id_t position_id,
      const tentacle::schema::address_t& from);

  /// Registration hook: create every instructed claim type for every
  /// position. `staking_amount` is the pre-aggregated size issued once per
  /// claim type.
  tentacle::schema::call_result_t on_registration(
      const tentacle::schema::address_t& caller,
      const tentacle::schema::address_t& beneficiary,
      const tentacle::schema::amount_t& staking_amount,
      const std::vector<tentacle::schema::position_id_t>& position_ids,
      const tentacle::schema::bytes_view_t& encoded_instructions);

  /// Redemption hook: destroy every outstanding claim for the position.
  tentacle::schema::call_result_t on_redemption(
      const tentacle::schema::address_t& caller,
      tentacle::schema::position_id_t position_id,
      const tentacle::schema::address_t& owner);

  /// True when no claim is outstanding, or when `authority` is not the
  /// configured staking authority.
  bool is_unlocked(const tentacle::schema::address_t& authority,
                   tentacle::schema::position_id_t position_id) const;

  tentacle::schema::claim_bitmap_t outstanding(
      tentacle::schema::position_id_t position_id) const;
  bool is_outstanding(tentacle::schema::position_id_t position_id,
                      tentacle::schema::claim_type_id_t claim_type_id) const;
  tentacle::schema::claim_type_config_t claim_type(
      tentacle::schema::claim_type_id_t claim_type_id) const;
  std::optional<tentacle::schema::address_t> default_helper(
      tentacle::schema::claim_type_id_t claim_type_id) const;

  /// Execute a read-path query by route.
  tentacle::schema::query_result_t query(
      std::string_view path,
      const tentacle::schema::bytes_view_t& data) const;

  /// Latest committed checkpoint.
  tentacle::storage::committed_state info() const;

  const tentacle::schema::address_t& self() const { return options_.self; }

 private:
  template <typename Body>
  tentacle::schema::call_result_t run_call(std::string_view codespace,
                                           Body&& body);

  /// Mark `position_ids` outstanding for one claim type and issue
  /// `staking_amount`, or the single position's current balance when none is
  /// given.
  tentacle::schema::call_result_t create_claim(
      state_frame& frame,
      std::string_view codespace,
      tentacle::schema::claim_type_id_t claim_type_id,
      std::span<const tentacle::schema::position_id_t> position_ids,
      const std::optional<tentacle::schema::amount_t>& staking_amount,
      const tentacle::schema::address_t& beneficiary,
      const std::optional<tentacle::schema::address_t>& helper_override);

  tentacle::schema::call_result_t destroy_claim(
      state_frame& frame,
      std::string_view codespace,
      tentacle::schema::claim_type_id_t claim_type_id,
      tentacle::schema::position_id_t position_id,
      const tentacle::schema::address_t& caller,
      const tentacle::schema::address_t& from);

  tentacle::schema::claim_bitmap_t load_bitmap(
      const state_frame& frame,
      tentacle::schema::position_id_t position_id) const;
  void store_bitmap(state_frame& frame,
                    tentacle::schema::position_id_t position_id,
                    const tentacle::schema::claim_bitmap_t& bitmap);
  tentacle::schema::claim_type_config_t load_config(
      const state_frame& frame,
      tentacle::schema::claim_type_id_t claim_type_id) const;
  std::optional<tentacle::schema::address_t> load_default_helper(
      const state_frame& frame,
      tentacle::schema::claim_type_id_t claim_type_id) const;

  /// Persist an outermost frame and fold it into the state root.
  void commit_frame(const state_frame& frame);

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  staking_authority_t authority_;
  contract_directory& directory_;
  engine_options options_;
  state_frame* active_frame_{nullptr};
  tentacle::storage::committed_state committed_;
};

}  // namespace tentacle::execution
