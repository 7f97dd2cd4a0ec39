#pragma once

#include <tentacle/schema/lock_event.hpp>
#include <tentacle/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tentacle::schema {

template <uint16_t Version>
struct call_result;

/// Outcome of one engine entry point. `code` is 0 on success, otherwise a
/// `lock_error_code`; state changes are kept only when `code` is 0.
template <>
struct call_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<lock_event_t> events;

  bool ok() const { return code == 0; }
};

using call_result_t = call_result<1>;

}  // namespace tentacle::schema
