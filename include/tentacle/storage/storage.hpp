#pragma once
#include <tentacle/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tentacle::storage {

using key_value_entry_t =
    std::pair<tentacle::schema::bytes_t, tentacle::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  tentacle::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<tentacle::schema::bytes_t> get_raw(
      const tentacle::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically persist a write set together with its checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tentacle::storage
