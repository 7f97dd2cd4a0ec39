#pragma once
#include <tentacle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: claim instruction.
// Lock workflow: one entry of the caller-supplied registration payload; asks
// for claim type `claim_type_id` to be created, optionally routed through a
// specific helper.
namespace tentacle::schema {

template <uint16_t Version>
struct claim_instruction;

template <>
struct claim_instruction<1> final {
  uint16_t version{1};
  claim_type_id_t claim_type_id{};
  std::optional<address_t> helper_override;
};

using claim_instruction_t = claim_instruction<1>;
using claim_instructions_t = std::vector<claim_instruction_t>;

}  // namespace tentacle::schema
