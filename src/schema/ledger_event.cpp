#include <safekeeper/schema/ledger_event.hpp>

namespace safekeeper::schema {

std::string_view event_type(const ledger_event_t& event) {
  return std::visit(
      overloaded{
          [](const treasure_stored_t&) { return std::string_view{"stored"}; },
          [](const treasure_claimed_t&) {
            return std::string_view{"claimed"};
          },
          [](const fee_updated_t&) { return std::string_view{"fee_updated"}; },
          [](const fees_withdrawn_t&) {
            return std::string_view{"fees_withdrawn"};
          },
          [](const ownership_transferred_t&) {
            return std::string_view{"ownership_transferred"};
          }},
      event);
}

}  // namespace safekeeper::schema
