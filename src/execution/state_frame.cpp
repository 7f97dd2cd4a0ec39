#include <tentacle/execution/state_frame.hpp>

namespace tentacle::execution {

state_frame::state_frame(const storage_t& storage, const state_frame* parent)
    : storage_{storage}, parent_{parent} {}

std::optional<tentacle::schema::bytes_t> state_frame::read(
    const tentacle::schema::bytes_t& key) const {
  if (auto it = writes_.find(key); it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->read(key);
  }
  return storage_.get_raw(
      tentacle::schema::bytes_view_t{key.data(), key.size()});
}

void state_frame::write(const tentacle::schema::bytes_t& key,
                        tentacle::schema::bytes_t value) {
  writes_.insert_or_assign(key, std::move(value));
}

void state_frame::merge_into(state_frame& parent) const {
  for (const auto& [key, value] : writes_) {
    parent.writes_.insert_or_assign(key, value);
  }
}

std::vector<tentacle::storage::key_value_entry_t> state_frame::entries()
    const {
  auto out = std::vector<tentacle::storage::key_value_entry_t>{};
  out.reserve(writes_.size());
  for (const auto& [key, value] : writes_) {
    out.emplace_back(key, value);
  }
  return out;
}

}  // namespace tentacle::execution
