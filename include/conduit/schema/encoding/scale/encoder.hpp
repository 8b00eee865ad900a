#pragma once
#include <conduit/common/critical.hpp>
#include <conduit/schema/encoding/encoder.hpp>
#include <conduit/schema/encoding/scale/authorization.hpp>
#include <conduit/schema/encoding/scale/authorization_msg.hpp>
#include <conduit/schema/encoding/scale/callback_info.hpp>
#include <conduit/schema/encoding/scale/committed_state.hpp>
#include <conduit/schema/encoding/scale/cosmos_msg.hpp>
#include <conduit/schema/encoding/scale/domain.hpp>
#include <conduit/schema/encoding/scale/execution_result.hpp>
#include <conduit/schema/encoding/scale/expiration.hpp>
#include <conduit/schema/encoding/scale/function.hpp>
#include <conduit/schema/encoding/scale/hyperlane.hpp>
#include <conduit/schema/encoding/scale/message_batch.hpp>
#include <conduit/schema/encoding/scale/message_details.hpp>
#include <conduit/schema/encoding/scale/page_request.hpp>
#include <conduit/schema/encoding/scale/polytone.hpp>
#include <conduit/schema/encoding/scale/processor_config.hpp>
#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <conduit/schema/encoding/scale/processor_msg.hpp>
#include <conduit/schema/encoding/scale/processor_state.hpp>
#include <conduit/schema/encoding/scale/subroutine.hpp>
#include <conduit/schema/encoding/scale/transaction.hpp>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace conduit::schema::encoding {

// Schema types encode field by field through the encode/decode overloads
// declared in their own namespace by the headers above.
struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  conduit::schema::bytes_t encode(const T& obj);

  /// Bytes this process wrote itself; a failure is fatal.
  template <typename T>
  T decode(const conduit::schema::bytes_view_t& bytes);

  /// Bytes from outside (transactions, contract messages, packets).
  template <typename T>
  std::optional<T> try_decode(const conduit::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
conduit::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    conduit::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const conduit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const conduit::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    conduit::common::critical("failed to decode SCALE bytes");
  }
  return std::move(*decoded);
}

}  // namespace conduit::schema::encoding
