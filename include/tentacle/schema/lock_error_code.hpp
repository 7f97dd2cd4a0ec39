#pragma once

#include <tentacle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lock error code.
// Lock workflow: stable numeric failure taxonomy returned in call results so
// callers can tell state conflicts apart from programming errors.
namespace tentacle::schema {

enum class lock_error_code : uint32_t {
  invalid_instructions = 1,
  // Routing / authorization
  not_staking_authority = 10,
  not_approved_or_owner = 11,
  not_administrator = 12,
  position_not_managed = 13,
  // Configuration
  claim_type_not_configured = 20,
  // State conflict
  already_created = 30,
  not_created = 31,
  duplicate_claim_type = 32,
  position_relocked = 33,
  // Policy conflict
  default_helper_conflict = 40,
  // Collaborators
  call_target_missing = 50,
  external_call_failed = 51,
};

template <>
struct enum_names<lock_error_code> final {
  static constexpr auto kMappings = std::array{
      std::pair<std::string_view, lock_error_code>{
          "invalid_instructions", lock_error_code::invalid_instructions},
      std::pair<std::string_view, lock_error_code>{
          "not_staking_authority", lock_error_code::not_staking_authority},
      std::pair<std::string_view, lock_error_code>{
          "not_approved_or_owner", lock_error_code::not_approved_or_owner},
      std::pair<std::string_view, lock_error_code>{
          "not_administrator", lock_error_code::not_administrator},
      std::pair<std::string_view, lock_error_code>{
          "position_not_managed", lock_error_code::position_not_managed},
      std::pair<std::string_view, lock_error_code>{
          "claim_type_not_configured",
          lock_error_code::claim_type_not_configured},
      std::pair<std::string_view, lock_error_code>{
          "already_created", lock_error_code::already_created},
      std::pair<std::string_view, lock_error_code>{
          "not_created", lock_error_code::not_created},
      std::pair<std::string_view, lock_error_code>{
          "duplicate_claim_type", lock_error_code::duplicate_claim_type},
      std::pair<std::string_view, lock_error_code>{
          "position_relocked", lock_error_code::position_relocked},
      std::pair<std::string_view, lock_error_code>{
          "default_helper_conflict", lock_error_code::default_helper_conflict},
      std::pair<std::string_view, lock_error_code>{
          "call_target_missing", lock_error_code::call_target_missing},
      std::pair<std::string_view, lock_error_code>{
          "external_call_failed", lock_error_code::external_call_failed}};
};

}  // namespace tentacle::schema
