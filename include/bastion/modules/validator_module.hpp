#pragma once

#include <bastion/host/endpoint.hpp>
#include <bastion/host/runtime.hpp>
#include <bastion/schema/module_call.hpp>
#include <bastion/schema/validation_code.hpp>

#include <string_view>

namespace bastion::modules {

/// Base for modules an account can install under a routing key.
///
/// Decodes the module envelope and dispatches to the hooks. Every hook is
/// keyed by `context.caller`, the account driving it; one module instance
/// serves any number of accounts.
class validator_module : public host::endpoint {
 public:
  bastion::schema::call_result_t handle(
      host::runtime& rt,
      const host::call_context& context) final;

 protected:
  virtual bastion::schema::call_result_t on_install(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& data) = 0;

  virtual bastion::schema::call_result_t on_uninstall(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& data) = 0;

  /// Must not write state.
  virtual bastion::schema::validation_code_t decide(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::authorization_request_t& request,
      const bastion::schema::hash32_t& request_hash) = 0;

  virtual bastion::schema::call_result_t on_extension(
      host::runtime& rt,
      const host::call_context& context,
      const bastion::schema::bytes_t& body) = 0;

  virtual std::string_view codespace() const = 0;
};

}  // namespace bastion::modules
