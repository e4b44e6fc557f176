#include <bastion/modules/validator_module.hpp>

namespace bastion::modules {

bastion::schema::call_result_t validator_module::handle(
    host::runtime& rt,
    const host::call_context& context) {
  auto& encoder = rt.journal().encoder();
  auto envelope = encoder.try_decode<bastion::schema::module_call_t>(
      bastion::schema::make_bytes_view(context.payload));
  if (!envelope) {
    return bastion::schema::make_failure(
        bastion::schema::error_code::invalid_payload,
        "module envelope is malformed", codespace());
  }

  return std::visit(
      overloaded{
          [&](const bastion::schema::install_hook_t& value) {
            return on_install(rt, context, value.data);
          },
          [&](const bastion::schema::uninstall_hook_t& value) {
            return on_uninstall(rt, context, value.data);
          },
          [&](const bastion::schema::decide_t& value) {
            auto code = decide(rt, context, value.request, value.request_hash);
            return bastion::schema::make_success(
                encoder.encode(static_cast<uint32_t>(code)));
          },
          [&](const bastion::schema::extension_call_t& value) {
            return on_extension(rt, context, value.body);
          }},
      *envelope);
}

}  // namespace bastion::modules
