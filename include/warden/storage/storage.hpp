#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <string_view>
#include <vector>

namespace warden::storage {

/// One journaled write: a value to put, or std::nullopt to delete.
using key_write_t = std::pair<warden::schema::bytes_t,
                              std::optional<warden::schema::bytes_t>>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  warden::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<warden::schema::bytes_t> get_raw(
      const warden::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically apply writes and record the checkpoint in the same batch.
  void commit(const std::vector<key_write_t>& writes,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
