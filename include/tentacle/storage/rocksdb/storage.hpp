#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tentacle/common/critical.hpp>
#include <tentacle/schema/encoding/scale/encoder.hpp>
#include <tentacle/storage/storage.hpp>
#include <memory>
#include <string_view>
#include <tuple>

namespace tentacle::storage {

namespace detail {

using encoder_t = tentacle::schema::encoding::encoder<
    tentacle::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tentacle::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<tentacle::schema::bytes_t> get_raw(
      const tentacle::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<tentacle::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const tentacle::schema::bytes_view_t& key) const {
  if (!database) {
    tentacle::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    tentacle::common::critical("Failed to read lock state: {}",
                               status.ToString());
  }
  return tentacle::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    tentacle::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    tentacle::common::critical("Failed to load committed checkpoint: {}",
                               committed_status.ToString());
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, tentacle::schema::hash32_t>>(
          tentacle::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    tentacle::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    tentacle::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(tentacle::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            tentacle::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      tentacle::common::critical("Failed to stage lock state write: {}",
                                 put_status.ToString());
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.sequence, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    tentacle::common::critical("Failed to stage committed checkpoint: {}",
                               state_status.ToString());
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    tentacle::common::critical("Failed to commit {} lock state write(s): {}",
                               entries.size(), write_status.ToString());
  }
}

}  // namespace tentacle::storage
