#include <warden/schema/transaction_error_code.hpp>

namespace warden::schema {

error_category_t category_of(const transaction_error_code code) {
  auto value = static_cast<uint32_t>(code);
  if (value < 10) {
    return error_category_t::admission;
  }
  if (value < 20) {
    return error_category_t::authorization;
  }
  if (value < 30) {
    return error_category_t::state;
  }
  if (value < 40) {
    return error_category_t::validation;
  }
  if (value < 50) {
    return error_category_t::signature;
  }
  return error_category_t::execution;
}

std::string_view codespace_of(const transaction_error_code code) {
  switch (category_of(code)) {
    case error_category_t::admission:
      return "warden.admission";
    case error_category_t::authorization:
      return "warden.authorization";
    case error_category_t::state:
      return "warden.state";
    case error_category_t::validation:
      return "warden.validation";
    case error_category_t::signature:
      return "warden.signature";
    case error_category_t::execution:
      return "warden.execution";
  }
  return "warden";
}

}  // namespace warden::schema
