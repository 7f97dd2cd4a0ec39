#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: lock event.
// Lock workflow: emitted on create/destroy/configure; carried in the call
// result only, so a rolled-back call emits nothing.
namespace tentacle::schema {

template <uint16_t Version>
struct lock_event_attribute;

template <>
struct lock_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using lock_event_attribute_t = lock_event_attribute<1>;

template <uint16_t Version>
struct lock_event;

template <>
struct lock_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<lock_event_attribute_t> attributes;
};

using lock_event_t = lock_event<1>;

}  // namespace tentacle::schema
