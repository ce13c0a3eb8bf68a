#pragma once

#include <safekeeper/schema/transaction_result.hpp>
#include <scale/scale.hpp>

namespace safekeeper::schema::encoding::scale {

void encode(const safekeeper::schema::transaction_result<1>& o,
            ::scale::Encoder& encoder);
void decode(safekeeper::schema::transaction_result<1>& o,
            ::scale::Decoder& decoder);

}  // namespace safekeeper::schema::encoding::scale

namespace safekeeper::schema {
using encoding::scale::decode;
using encoding::scale::encode;
}  // namespace safekeeper::schema
