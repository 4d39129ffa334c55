#pragma once
#include <autoproof/schema/burn_part.hpp>
#include <autoproof/schema/primitives.hpp>
#include <autoproof/schema/register_part.hpp>
#include <autoproof/schema/set_paused.hpp>
#include <autoproof/schema/transfer_admin.hpp>
#include <autoproof/schema/transfer_part.hpp>
#include <autoproof/schema/update_part_status.hpp>
#include <variant>

namespace autoproof::schema {

using transaction_payload_t = std::variant<set_paused_t,
                                           transfer_admin_t,
                                           register_part_t,
                                           transfer_part_t,
                                           update_part_status_t,
                                           burn_part_t>;

template <uint16_t Version>
struct transaction;

// The caller arrives pre-authenticated by the host; there is no signature.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  principal_t caller;
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace autoproof::schema
