#pragma once

#include <tentacle/execution/engine.hpp>
#include <tentacle/schema/claim_instruction.hpp>
#include <tentacle/schema/primitives.hpp>
#include <tentacle/storage/rocksdb/storage.hpp>
#include <tentacle/testing/collaborators.hpp>
#include <tentacle/testing/common.hpp>

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tentacle::testing {

using scale_encoder_t = tentacle::execution::engine::encoder_t;

/// Engine over a scratch RocksDB directory with in-memory collaborators.
///
/// Identities: authority = make_address(0xA0), self = make_address(0xB0),
/// administrator = make_address(0xC0).
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{tentacle::storage::make_storage<
            tentacle::storage::rocksdb_storage_tag>(db_path_)},
        authority_{make_address(0xA0)} {
    reopen();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  /// Rebuild the engine over the same storage (simulates a restart).
  void reopen() {
    engine_.reset();
    engine_ = std::make_unique<tentacle::execution::engine>(
        encoder_, storage_, authority_.view(), directory_,
        tentacle::execution::engine_options{.self = self(),
                                            .administrator = admin()});
  }

  tentacle::execution::engine& engine() { return *engine_; }
  fake_staking_authority& authority() { return authority_; }
  tentacle::execution::contract_directory& directory() { return directory_; }
  scale_encoder_t& encoder() { return encoder_; }

  static tentacle::schema::address_t self() { return make_address(0xB0); }
  static tentacle::schema::address_t admin() { return make_address(0xC0); }

  /// Register a recording derivative at `address` and configure claim type
  /// `claim_type_id` to issue through it.
  recording_derivative& add_claim_type(
      const tentacle::schema::claim_type_id_t claim_type_id,
      const tentacle::schema::address_t& address,
      tentacle::schema::claim_type_config_t config = {},
      const std::optional<tentacle::schema::address_t>& default_helper =
          std::nullopt) {
    auto& derivative = derivatives_[address];
    directory_.register_derivative(address, derivative.contract());
    config.derivative_contract = address;
    const auto result =
        engine_->configure(admin(), claim_type_id, config, default_helper);
    EXPECT_EQ(result.code, 0u) << result.log;
    return derivative;
  }

  recording_helper& add_helper(const tentacle::schema::address_t& address) {
    auto& helper = helpers_[address];
    directory_.register_helper(address, helper.module());
    return helper;
  }

  /// Stake a position owned by `owner` and locked by this engine.
  void stake(const tentacle::schema::position_id_t position_id,
             const tentacle::schema::address_t& owner,
             const tentacle::schema::amount_t& balance) {
    authority_.stake(position_id, owner, balance, self());
  }

  tentacle::schema::bytes_t encode_instructions(
      const tentacle::schema::claim_instructions_t& instructions) {
    return encoder_.encode(instructions);
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  tentacle::storage::storage<tentacle::storage::rocksdb_storage_tag> storage_;
  fake_staking_authority authority_;
  tentacle::execution::contract_directory directory_;
  std::map<tentacle::schema::address_t, recording_derivative> derivatives_;
  std::map<tentacle::schema::address_t, recording_helper> helpers_;
  std::unique_ptr<tentacle::execution::engine> engine_;
};

inline tentacle::schema::claim_instruction_t make_instruction(
    const tentacle::schema::claim_type_id_t claim_type_id,
    const std::optional<tentacle::schema::address_t>& helper_override =
        std::nullopt) {
  return tentacle::schema::claim_instruction_t{
      .claim_type_id = claim_type_id, .helper_override = helper_override};
}

}  // namespace tentacle::testing
