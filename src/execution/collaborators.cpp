#include <spdlog/spdlog.h>
#include <tentacle/execution/collaborators.hpp>
#include <utility>

namespace tentacle::execution {

void contract_directory::register_derivative(
    const tentacle::schema::address_t& address,
    derivative_contract_t contract) {
  spdlog::debug("Registering derivative contract {}",
                tentacle::schema::to_string(address));
  derivatives_.insert_or_assign(address, std::move(contract));
}

void contract_directory::register_helper(
    const tentacle::schema::address_t& address,
    helper_module_t helper) {
  spdlog::debug("Registering helper module {}",
                tentacle::schema::to_string(address));
  helpers_.insert_or_assign(address, std::move(helper));
}

const derivative_contract_t* contract_directory::find_derivative(
    const tentacle::schema::address_t& address) const {
  auto it = derivatives_.find(address);
  if (it == std::end(derivatives_)) {
    return nullptr;
  }
  return &it->second;
}

const helper_module_t* contract_directory::find_helper(
    const tentacle::schema::address_t& address) const {
  auto it = helpers_.find(address);
  if (it == std::end(helpers_)) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace tentacle::execution
