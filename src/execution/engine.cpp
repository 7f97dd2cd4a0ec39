#include <spdlog/spdlog.h>
#include <tentacle/blake3/hash.hpp>
#include <tentacle/execution/engine.hpp>
#include <tentacle/execution/helper_resolution.hpp>
#include <tentacle/schema/key/lock_keys.hpp>
#include <tentacle/schema/query_error_code.hpp>
#include <array>
#include <iterator>
#include <span>
#include <string>
#include <tuple>
#include <utility>

using namespace tentacle::schema;

namespace {

// Points the engine at a frame for the lifetime of one entry point and
// restores the outer frame however the call exits.
struct frame_activation final {
  frame_activation(tentacle::execution::state_frame*& slot,
                   tentacle::execution::state_frame* next)
      : slot_{slot}, previous_{slot} {
    slot_ = next;
  }
  frame_activation(const frame_activation&) = delete;
  frame_activation& operator=(const frame_activation&) = delete;
  ~frame_activation() { slot_ = previous_; }

 private:
  tentacle::execution::state_frame*& slot_;
  tentacle::execution::state_frame* previous_;
};

call_result_t make_error(const lock_error_code code,
                         const std::string_view codespace,
                         std::string log,
                         std::string info = {}) {
  auto result = call_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

lock_event_t make_event(
    std::string type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = lock_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(lock_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  return event;
}

std::string join_positions(std::span<const position_id_t> position_ids) {
  auto out = std::string{};
  for (const auto position_id : position_ids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(position_id);
  }
  return out;
}

void append_events(call_result_t& into, call_result_t&& from) {
  into.events.insert(std::end(into.events),
                     std::make_move_iterator(std::begin(from.events)),
                     std::make_move_iterator(std::end(from.events)));
}

}  // namespace

namespace tentacle::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               staking_authority_t authority,
               contract_directory& directory,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      authority_{std::move(authority)},
      directory_{directory},
      options_{options} {
  auto lock = std::scoped_lock{mutex_};
  if (auto committed = storage_.load_committed_state()) {
    committed_ = *committed;
  }
  if (is_null(authority_.identity)) {
    spdlog::warn("Staking authority identity is null; hooks will reject all "
                 "callers");
  }
  spdlog::info("Lock engine {} ready at sequence {} (authority {})",
               to_string(options_.self), committed_.sequence,
               to_string(authority_.identity));
}

template <typename Body>
call_result_t engine::run_call(const std::string_view codespace,
                               Body&& body) {
  auto lock = std::scoped_lock{mutex_};
  auto frame = state_frame{storage_, active_frame_};
  auto* parent = active_frame_;
  auto result = call_result_t{};
  {
    auto activation = frame_activation{active_frame_, &frame};
    try {
      result = body(frame);
    } catch (const std::exception& ex) {
      spdlog::warn("{}: collaborator call failed: {}", codespace, ex.what());
      result = make_error(lock_error_code::external_call_failed, codespace,
                          "external call failed", ex.what());
    }
  }

  if (!result.ok()) {
    spdlog::debug("{}: rejected with {} ({})", codespace,
                  code_name<lock_error_code>(result.code),
                  result.info);
    return result;
  }
  if (parent != nullptr) {
    frame.merge_into(*parent);
  } else {
    commit_frame(frame);
  }
  return result;
}

call_result_t engine::configure(const address_t& caller,
                                const claim_type_id_t claim_type_id,
                                const claim_type_config_t& config,
                                const std::optional<address_t>& default_helper) {
  constexpr auto kCodespace = std::string_view{"tentacle.configure"};
  return run_call(kCodespace, [&](state_frame& frame) {
    if (caller != options_.administrator) {
      return make_error(lock_error_code::not_administrator, kCodespace,
                        "caller may not configure claim types",
                        to_string(caller));
    }

    auto previous = load_config(frame, claim_type_id);
    if (is_configured(previous)) {
      spdlog::warn("Overwriting configuration of claim type {}",
                   claim_type_id);
    }
    auto helper = default_helper.value_or(address_t{});
    if (config.has_default_helper && is_null(helper)) {
      spdlog::warn("Claim type {} enables a default helper but none is set",
                   claim_type_id);
    }

    auto stored = config;
    stored.version = 1;
    frame.write(key::make_claim_type_key(encoder_, claim_type_id),
                encoder_.encode(stored));
    frame.write(key::make_default_helper_key(encoder_, claim_type_id),
                encoder_.encode(helper));

    auto result = call_result_t{};
    result.codespace = std::string{kCodespace};
    result.events.push_back(make_event(
        "claim_type_configured",
        {{"claim_type", std::to_string(claim_type_id)},
         {"derivative_contract", to_string(stored.derivative_contract)},
         {"default_helper", to_string(helper)}}));
    spdlog::info("Configured claim type {} -> {}", claim_type_id,
                 to_string(stored.derivative_contract));
    return result;
  });
}

call_result_t engine::create(const address_t& caller,
                             const claim_type_id_t claim_type_id,
                             const position_id_t position_id,
                             const address_t& beneficiary,
                             const std::optional<address_t>& helper_override) {
  constexpr auto kCodespace = std::string_view{"tentacle.create"};
  return run_call(kCodespace, [&](state_frame& frame) {
    if (!authority_.is_approved_or_owner(caller, position_id)) {
      return make_error(lock_error_code::not_approved_or_owner, kCodespace,
                        "caller is not owner or approved",
                        std::to_string(position_id));
    }
    if (authority_.lock_manager(position_id) != options_.self) {
      return make_error(lock_error_code::position_not_managed, kCodespace,
                        "position is not locked by this manager",
                        std::to_string(position_id));
    }
    auto positions = std::array{position_id};
    return create_claim(frame, kCodespace, claim_type_id, positions,
                        std::nullopt, beneficiary, helper_override);
  });
}

call_result_t engine::destroy(const address_t& caller,
                              const claim_type_id_t claim_type_id,
                              const position_id_t position_id,
                              const address_t& from) {
  constexpr auto kCodespace = std::string_view{"tentacle.destroy"};
  return run_call(kCodespace, [&](state_frame& frame) {
    if (!authority_.is_approved_or_owner(caller, position_id)) {
      return make_error(lock_error_code::not_approved_or_owner, kCodespace,
                        "caller is not owner or approved",
                        std::to_string(position_id));
    }
    return destroy_claim(frame, kCodespace, claim_type_id, position_id, caller,
                         from);
  });
}

call_result_t engine::on_registration(
    const address_t& caller,
    const address_t& beneficiary,
    const amount_t& staking_amount,
    const std::vector<position_id_t>& position_ids,
    const bytes_view_t& encoded_instructions) {
  constexpr auto kCodespace = std::string_view{"tentacle.registration"};
  return run_call(kCodespace, [&](state_frame& frame) {
    if (caller != authority_.identity) {
      return make_error(lock_error_code::not_staking_authority, kCodespace,
                        "hook caller is not the staking authority",
                        to_string(caller));
    }

    auto instructions =
        encoder_.try_decode<claim_instructions_t>(encoded_instructions);
    if (!instructions) {
      return make_error(lock_error_code::invalid_instructions, kCodespace,
                        "failed to decode claim instructions");
    }

    // Reject the whole batch before any bit is touched.
    auto seen = claim_bitmap_t{};
    for (const auto& instruction : *instructions) {
      if (instruction.version != 1) {
        return make_error(lock_error_code::invalid_instructions, kCodespace,
                          "unsupported claim instruction version",
                          std::to_string(instruction.version));
      }
      if (is_set(seen, instruction.claim_type_id)) {
        return make_error(lock_error_code::duplicate_claim_type, kCodespace,
                          "claim type listed twice",
                          std::to_string(instruction.claim_type_id));
      }
      seen = set(seen, instruction.claim_type_id);
    }

    auto result = call_result_t{};
    result.codespace = std::string{kCodespace};
    if (position_ids.empty()) {
      spdlog::debug("Registration without positions; nothing to create");
      return result;
    }
    for (const auto& instruction : *instructions) {
      auto created = create_claim(frame, kCodespace, instruction.claim_type_id,
                                  position_ids, staking_amount, beneficiary,
                                  instruction.helper_override);
      if (!created.ok()) {
        return created;
      }
      append_events(result, std::move(created));
    }
    result.info = "created " + std::to_string(instructions->size()) +
                  " claim type(s) for " + std::to_string(position_ids.size()) +
                  " position(s)";
    return result;
  });
}

call_result_t engine::on_redemption(const address_t& caller,
                                    const position_id_t position_id,
                                    const address_t& owner) {
  constexpr auto kCodespace = std::string_view{"tentacle.redemption"};
  return run_call(kCodespace, [&](state_frame& frame) {
    if (caller != authority_.identity) {
      return make_error(lock_error_code::not_staking_authority, kCodespace,
                        "hook caller is not the staking authority",
                        to_string(caller));
    }

    auto result = call_result_t{};
    result.codespace = std::string{kCodespace};
    // A burn may reenter and create or destroy claims for this position, so
    // the bitmap is reloaded after every destroy.
    auto destroyed_count = std::size_t{0};
    auto bitmap = load_bitmap(frame, position_id);
    for (auto i = std::size_t{0}; i < kClaimTypeCount; ++i) {
      const auto claim_type_id = static_cast<claim_type_id_t>(i);
      if (!is_set(bitmap, claim_type_id)) {
        continue;
      }
      auto destroyed = destroy_claim(frame, kCodespace, claim_type_id,
                                     position_id, owner, owner);
      if (!destroyed.ok()) {
        return destroyed;
      }
      append_events(result, std::move(destroyed));
      ++destroyed_count;
      bitmap = load_bitmap(frame, position_id);
    }
    if (!none(bitmap)) {
      return make_error(lock_error_code::position_relocked, kCodespace,
                        "claims were created during redemption",
                        std::to_string(position_id));
    }
    result.info = "destroyed " + std::to_string(destroyed_count) + " claim(s)";
    spdlog::info("Redeemed position {}: {} claim(s) destroyed", position_id,
                 destroyed_count);
    return result;
  });
}

call_result_t engine::create_claim(
    state_frame& frame,
    const std::string_view codespace,
    const claim_type_id_t claim_type_id,
    std::span<const position_id_t> position_ids,
    const std::optional<amount_t>& staking_amount,
    const address_t& beneficiary,
    const std::optional<address_t>& helper_override) {
  auto config = load_config(frame, claim_type_id);
  if (!is_configured(config)) {
    return make_error(lock_error_code::claim_type_not_configured, codespace,
                      "claim type has no derivative contract",
                      std::to_string(claim_type_id));
  }

  // Bits go in before any collaborator runs so a reentrant create for the
  // same pair sees ALREADY_CREATED.
  for (const auto position_id : position_ids) {
    auto bitmap = load_bitmap(frame, position_id);
    if (is_set(bitmap, claim_type_id)) {
      return make_error(lock_error_code::already_created, codespace,
                        "claim already outstanding",
                        std::to_string(position_id) + ":" +
                            std::to_string(claim_type_id));
    }
    store_bitmap(frame, position_id, set(bitmap, claim_type_id));
  }

  // A single create is sized by the position's current weight.
  const auto amount = staking_amount
                          ? *staking_amount
                          : authority_.staking_token_balance(position_ids[0]);

  auto resolution = resolve_helper(config, helper_override,
                                   load_default_helper(frame, claim_type_id));
  if (resolution.error) {
    return make_error(*resolution.error, codespace,
                      "helper override conflicts with forced default",
                      std::to_string(claim_type_id));
  }

  const auto* derivative = directory_.find_derivative(config.derivative_contract);
  if (derivative == nullptr) {
    return make_error(lock_error_code::call_target_missing, codespace,
                      "derivative contract not reachable",
                      to_string(config.derivative_contract));
  }

  auto recipient = beneficiary;
  if (resolution.helper) {
    const auto* helper = directory_.find_helper(*resolution.helper);
    if (helper == nullptr) {
      return make_error(lock_error_code::call_target_missing, codespace,
                        "helper module not reachable",
                        to_string(*resolution.helper));
    }
    recipient = *resolution.helper;
    derivative->mint(recipient, amount);
    helper->create_for(
        claim_type_id, config.derivative_contract,
        std::vector<position_id_t>(std::begin(position_ids),
                                   std::end(position_ids)),
        amount, beneficiary);
  } else {
    derivative->mint(recipient, amount);
  }

  auto result = call_result_t{};
  result.codespace = std::string{codespace};
  result.events.push_back(
      make_event("claim_created",
                 {{"claim_type", std::to_string(claim_type_id)},
                  {"positions", join_positions(position_ids)},
                  {"amount", amount.str()},
                  {"recipient", to_string(recipient)},
                  {"beneficiary", to_string(beneficiary)}}));
  spdlog::info("Created claim type {} for position(s) {} ({} to {})",
               claim_type_id, join_positions(position_ids), amount.str(),
               to_string(recipient));
  return result;
}

call_result_t engine::destroy_claim(state_frame& frame,
                                    const std::string_view codespace,
                                    const claim_type_id_t claim_type_id,
                                    const position_id_t position_id,
                                    const address_t& caller,
                                    const address_t& from) {
  auto bitmap = load_bitmap(frame, position_id);
  if (!is_set(bitmap, claim_type_id)) {
    return make_error(lock_error_code::not_created, codespace,
                      "claim is not outstanding",
                      std::to_string(position_id) + ":" +
                          std::to_string(claim_type_id));
  }
  auto config = load_config(frame, claim_type_id);
  if (!is_configured(config)) {
    return make_error(lock_error_code::claim_type_not_configured, codespace,
                      "claim type has no derivative contract",
                      std::to_string(claim_type_id));
  }
  const auto* derivative = directory_.find_derivative(config.derivative_contract);
  if (derivative == nullptr) {
    return make_error(lock_error_code::call_target_missing, codespace,
                      "derivative contract not reachable",
                      to_string(config.derivative_contract));
  }

  // Settled against the position's value now, not at creation time.
  auto amount = authority_.staking_token_balance(position_id);
  store_bitmap(frame, position_id, clear(bitmap, claim_type_id));
  derivative->burn(caller, from, amount);

  auto result = call_result_t{};
  result.codespace = std::string{codespace};
  result.events.push_back(
      make_event("claim_destroyed",
                 {{"claim_type", std::to_string(claim_type_id)},
                  {"position", std::to_string(position_id)},
                  {"amount", amount.str()},
                  {"from", to_string(from)}}));
  spdlog::info("Destroyed claim type {} for position {} ({} from {})",
               claim_type_id, position_id, amount.str(), to_string(from));
  return result;
}

bool engine::is_unlocked(const address_t& authority,
                         const position_id_t position_id) const {
  if (authority != authority_.identity) {
    spdlog::debug("Unlock query from unknown authority {}; reporting unlocked",
                  to_string(authority));
    return true;
  }
  return none(outstanding(position_id));
}

claim_bitmap_t engine::outstanding(const position_id_t position_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = state_frame{storage_, active_frame_};
  return load_bitmap(view, position_id);
}

bool engine::is_outstanding(const position_id_t position_id,
                            const claim_type_id_t claim_type_id) const {
  return is_set(outstanding(position_id), claim_type_id);
}

claim_type_config_t engine::claim_type(
    const claim_type_id_t claim_type_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = state_frame{storage_, active_frame_};
  return load_config(view, claim_type_id);
}

std::optional<address_t> engine::default_helper(
    const claim_type_id_t claim_type_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = state_frame{storage_, active_frame_};
  return load_default_helper(view, claim_type_id);
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.codespace = "tentacle.query";
  result.key = make_bytes(data);
  result.sequence = committed_.sequence;

  auto reject = [&](const query_error_code code, std::string info) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::string{to_string(code)};
    result.info = std::move(info);
    return result;
  };

  if (path == "/lock/outstanding") {
    auto position_id = encoder_.try_decode<position_id_t>(data);
    if (!position_id) {
      return reject(query_error_code::invalid_key, "expected position id");
    }
    result.value = encoder_.encode(outstanding(*position_id));
    return result;
  }
  if (path == "/lock/unlocked") {
    auto decoded =
        encoder_.try_decode<std::tuple<address_t, position_id_t>>(data);
    if (!decoded) {
      return reject(query_error_code::invalid_key,
                    "expected (authority, position id)");
    }
    result.value = encoder_.encode(
        is_unlocked(std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }
  if (path == "/claim_type/config") {
    auto claim_type_id = encoder_.try_decode<claim_type_id_t>(data);
    if (!claim_type_id) {
      return reject(query_error_code::invalid_key, "expected claim type id");
    }
    auto config = claim_type(*claim_type_id);
    if (!is_configured(config)) {
      return reject(query_error_code::not_found,
                    "claim type " + std::to_string(*claim_type_id) +
                        " is not configured");
    }
    result.value = encoder_.encode(
        std::tuple{config, default_helper(*claim_type_id)});
    return result;
  }
  if (path == "/engine/info") {
    result.value =
        encoder_.encode(std::tuple{committed_.sequence, committed_.state_root});
    return result;
  }

  return reject(query_error_code::unsupported_path, std::string{path});
}

tentacle::storage::committed_state engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_;
}

claim_bitmap_t engine::load_bitmap(const state_frame& frame,
                                   const position_id_t position_id) const {
  auto raw = frame.read(key::make_bitmap_key(encoder_, position_id));
  if (!raw) {
    return claim_bitmap_t{};
  }
  return encoder_.decode<claim_bitmap_t>(bytes_view_t{raw->data(), raw->size()});
}

void engine::store_bitmap(state_frame& frame,
                          const position_id_t position_id,
                          const claim_bitmap_t& bitmap) {
  frame.write(key::make_bitmap_key(encoder_, position_id),
              encoder_.encode(bitmap));
}

claim_type_config_t engine::load_config(
    const state_frame& frame,
    const claim_type_id_t claim_type_id) const {
  auto raw = frame.read(key::make_claim_type_key(encoder_, claim_type_id));
  if (!raw) {
    return claim_type_config_t{};
  }
  return encoder_.decode<claim_type_config_t>(
      bytes_view_t{raw->data(), raw->size()});
}

std::optional<address_t> engine::load_default_helper(
    const state_frame& frame,
    const claim_type_id_t claim_type_id) const {
  auto raw = frame.read(key::make_default_helper_key(encoder_, claim_type_id));
  if (!raw) {
    return std::nullopt;
  }
  auto helper =
      encoder_.decode<address_t>(bytes_view_t{raw->data(), raw->size()});
  if (is_null(helper)) {
    return std::nullopt;
  }
  return helper;
}

void engine::commit_frame(const state_frame& frame) {
  if (frame.empty()) {
    return;
  }
  auto entries = frame.entries();
  auto material = encoder_.encode(entries);
  committed_.state_root = tentacle::blake3::fold(
      committed_.state_root, bytes_view_t{material.data(), material.size()});
  ++committed_.sequence;
  storage_.commit(entries, committed_);
  spdlog::debug("Committed {} write(s) at sequence {}", entries.size(),
                committed_.sequence);
}

}  // namespace tentacle::execution
