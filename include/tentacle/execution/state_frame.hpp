#pragma once

#include <tentacle/schema/primitives.hpp>
#include <tentacle/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace tentacle::execution {

/// Buffered write set for one engine entry point.
///
/// Reads fall through this frame's writes, then the parent frame, then
/// storage. Nothing reaches storage until the outermost frame is committed;
/// a frame that is dropped leaves no trace. Nested (reentrant) calls get a
/// child frame that is merged into its parent on success.
class state_frame final {
 public:
  using storage_t =
      tentacle::storage::storage<tentacle::storage::rocksdb_storage_tag>;

  state_frame(const storage_t& storage, const state_frame* parent);

  state_frame(const state_frame&) = delete;
  state_frame& operator=(const state_frame&) = delete;

  std::optional<tentacle::schema::bytes_t> read(
      const tentacle::schema::bytes_t& key) const;
  void write(const tentacle::schema::bytes_t& key,
             tentacle::schema::bytes_t value);

  void merge_into(state_frame& parent) const;

  /// Buffered writes in key order.
  std::vector<tentacle::storage::key_value_entry_t> entries() const;
  bool empty() const { return writes_.empty(); }

 private:
  const storage_t& storage_;
  const state_frame* parent_;
  std::map<tentacle::schema::bytes_t, tentacle::schema::bytes_t> writes_;
};

}  // namespace tentacle::execution
