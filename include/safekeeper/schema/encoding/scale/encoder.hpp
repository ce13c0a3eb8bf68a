#pragma once
#include <safekeeper/common/critical.hpp>
#include <safekeeper/schema/encoding/encoder.hpp>
#include <safekeeper/schema/encoding/scale/fee_policy.hpp>
#include <safekeeper/schema/encoding/scale/history_entry.hpp>
#include <safekeeper/schema/encoding/scale/ledger_event.hpp>
#include <safekeeper/schema/encoding/scale/query_result.hpp>
#include <safekeeper/schema/encoding/scale/transaction.hpp>
#include <safekeeper/schema/encoding/scale/transaction_result.hpp>
#include <safekeeper/schema/encoding/scale/treasure.hpp>
#include <safekeeper/schema/encoding/scale/treasury_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace safekeeper::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  safekeeper::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, safekeeper::schema::bytes_t& out);

  template <typename T>
  T decode(const safekeeper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const safekeeper::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
safekeeper::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    safekeeper::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        safekeeper::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const safekeeper::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    safekeeper::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const safekeeper::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace safekeeper::schema::encoding
