#pragma once

#include <safekeeper/schema/primitives.hpp>
#include <functional>

namespace safekeeper::execution {

using signature_verifier_t =
    std::function<bool(const safekeeper::schema::bytes_view_t& message,
                       const safekeeper::schema::account_id_t& signer,
                       const safekeeper::schema::signature_t& signature)>;

}  // namespace safekeeper::execution
