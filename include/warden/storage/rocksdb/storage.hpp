#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace warden::storage {

namespace detail {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const warden::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<warden::schema::bytes_t> get_raw(
      const warden::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_write_t>& writes,
              const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<warden::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      warden::common::critical("Failed to get value from RocksDB");
    }
  }
  return warden::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    warden::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, warden::schema::hash32_t>>(
          warden::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    warden::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_write_t>& writes,
    const committed_state& state) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(warden::schema::bytes_view_t{key});
    auto status = value
                      ? batch.Put(key_slice, detail::to_slice(
                                                 warden::schema::bytes_view_t{
                                                     *value}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      warden::common::critical("failed staging key in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status =
      batch.Put(std::string{detail::kCommittedHeightKey},
                std::string{reinterpret_cast<const char*>(encoded.data()),
                            encoded.size()});
  if (!state_status.ok()) {
    warden::common::critical("failed staging committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to write commit batch: {}",
                  write_status.ToString());
    warden::common::critical("failed to commit block state");
  }
}

}  // namespace warden::storage
