#pragma once

#include <autoproof/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Registry workflow: Defines canonical key prefixes and key codecs for registry
// state, part records and the per-part history log.
namespace autoproof::schema::key {

inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kChainIdKeyPrefix{"SYS|STATE|CHAIN_ID|"};
inline constexpr std::string_view kPartMetadataKeyPrefix{
    "SYS|STATE|PART|META|"};
inline constexpr std::string_view kPartOwnerKeyPrefix{"SYS|STATE|PART|OWNER|"};
inline constexpr std::string_view kPartTokenKeyPrefix{"SYS|STATE|PART|TOKEN|"};
inline constexpr std::string_view kPartHistoryCountKeyPrefix{
    "SYS|STATE|PART|HISTORY_COUNT|"};
inline constexpr std::string_view kPartHistoryPrefix{"SYS|HISTORY|PART|"};

inline constexpr std::array<std::string_view, 7> kEngineKeyspaces{
    kRegistryKeyPrefix,
    kChainIdKeyPrefix,
    kPartMetadataKeyPrefix,
    kPartOwnerKeyPrefix,
    kPartTokenKeyPrefix,
    kPartHistoryCountKeyPrefix,
    kPartHistoryPrefix};

template <typename Encoder, typename T>
autoproof::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
autoproof::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
autoproof::schema::bytes_t make_registry_state_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
autoproof::schema::bytes_t make_chain_id_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kChainIdKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
autoproof::schema::bytes_t make_part_metadata_key(
    Encoder& encoder,
    const autoproof::schema::part_id_t part_id) {
  return make_prefixed_key(encoder, kPartMetadataKeyPrefix, part_id);
}

template <typename Encoder>
autoproof::schema::bytes_t make_part_owner_key(
    Encoder& encoder,
    const autoproof::schema::part_id_t part_id) {
  return make_prefixed_key(encoder, kPartOwnerKeyPrefix, part_id);
}

template <typename Encoder>
autoproof::schema::bytes_t make_part_token_key(
    Encoder& encoder,
    const autoproof::schema::part_id_t part_id) {
  return make_prefixed_key(encoder, kPartTokenKeyPrefix, part_id);
}

template <typename Encoder>
autoproof::schema::bytes_t make_part_history_count_key(
    Encoder& encoder,
    const autoproof::schema::part_id_t part_id) {
  return make_prefixed_key(encoder, kPartHistoryCountKeyPrefix, part_id);
}

template <typename Encoder>
autoproof::schema::bytes_t make_part_history_key(
    Encoder& encoder,
    const autoproof::schema::part_id_t part_id,
    const autoproof::schema::history_index_t index) {
  return make_prefixed_key(encoder, kPartHistoryPrefix,
                           std::tuple{part_id, index});
}

}  // namespace autoproof::schema::key
