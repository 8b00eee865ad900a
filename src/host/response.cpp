#include <conduit/host/response.hpp>

namespace conduit::host {

response& response::add_message(conduit::schema::cosmos_msg_t msg) {
  messages.push_back(sub_msg{.msg = std::move(msg)});
  return *this;
}

response& response::add_submessage(sub_msg msg) {
  messages.push_back(std::move(msg));
  return *this;
}

response& response::add_attribute(std::string key, std::string value) {
  attributes.push_back(conduit::schema::event_attribute_t{
      .key = std::move(key), .value = std::move(value)});
  return *this;
}

conduit::schema::query_result_t make_query_error(
    const conduit::schema::query_error_code code,
    std::string log,
    const std::string_view codespace) {
  return conduit::schema::query_result_t{.code = static_cast<uint32_t>(code),
                                         .log = std::move(log),
                                         .codespace = std::string{codespace}};
}

conduit::schema::query_result_t make_query_value(
    conduit::schema::bytes_t key,
    conduit::schema::bytes_t value) {
  return conduit::schema::query_result_t{.log = "ok",
                                         .key = std::move(key),
                                         .value = std::move(value)};
}

}  // namespace conduit::host
