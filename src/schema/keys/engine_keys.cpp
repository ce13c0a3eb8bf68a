#include <safekeeper/schema/key/engine_keys.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>

namespace safekeeper::schema::key {

namespace {

template <typename Buffer>
void append_buffer(safekeeper::schema::bytes_t& out, const Buffer& buffer) {
  const auto* data = reinterpret_cast<const uint8_t*>(buffer.data());
  out.insert(std::end(out), data, data + sizeof(Buffer));
}

safekeeper::schema::bytes_t make_account_key(
    std::string_view prefix,
    const safekeeper::schema::account_id_t& account) {
  return make_prefixed_key(
      prefix, safekeeper::schema::bytes_view_t{account.data(), account.size()});
}

}  // namespace

safekeeper::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const safekeeper::schema::bytes_view_t& suffix) {
  auto key = safekeeper::schema::make_bytes(prefix);
  key.reserve(key.size() + suffix.size());
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

safekeeper::schema::bytes_t make_treasure_key(
    safekeeper::schema::treasure_id_t treasure_id) {
  auto key = safekeeper::schema::make_bytes(kTreasureKeyPrefix);
  append_buffer(key, boost::endian::big_uint64_buf_t{treasure_id});
  return key;
}

safekeeper::schema::bytes_t make_depositor_index_key(
    const safekeeper::schema::account_id_t& depositor) {
  return make_account_key(kDepositorIndexPrefix, depositor);
}

safekeeper::schema::bytes_t make_beneficiary_index_key(
    const safekeeper::schema::account_id_t& beneficiary) {
  return make_account_key(kBeneficiaryIndexPrefix, beneficiary);
}

safekeeper::schema::bytes_t make_balance_key(
    const safekeeper::schema::account_id_t& account) {
  return make_account_key(kBalanceKeyPrefix, account);
}

safekeeper::schema::bytes_t make_nonce_key(
    const safekeeper::schema::account_id_t& signer) {
  return make_account_key(kNonceKeyPrefix, signer);
}

safekeeper::schema::bytes_t make_history_key(uint64_t height, uint32_t index) {
  auto key = safekeeper::schema::make_bytes(kHistoryPrefix);
  append_buffer(key, boost::endian::big_uint64_buf_t{height});
  append_buffer(key, boost::endian::big_uint32_buf_t{index});
  return key;
}

safekeeper::schema::bytes_t make_event_key(uint64_t event_id) {
  auto key = safekeeper::schema::make_bytes(kEventPrefix);
  append_buffer(key, boost::endian::big_uint64_buf_t{event_id});
  return key;
}

std::optional<safekeeper::schema::account_id_t> parse_account_key(
    std::string_view prefix,
    const safekeeper::schema::bytes_view_t& key) {
  auto account = safekeeper::schema::account_id_t{};
  if (key.size() != prefix.size() + account.size()) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                  [](char lhs, uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  std::copy_n(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
              account.size(), std::begin(account));
  return account;
}

}  // namespace safekeeper::schema::key
