#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace warden::state {

/// Read side of a key-value view.
class reader {
 public:
  virtual ~reader() = default;

  /// Raw bytes at key, or std::nullopt when absent.
  virtual std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const = 0;
};

/// Reads straight from committed storage.
template <typename Storage>
class committed_reader final : public reader {
 public:
  explicit committed_reader(Storage& storage) : storage_{storage} {}

  std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const override {
    return storage_.get_raw(key);
  }

 private:
  Storage& storage_;
};

/// Journaled view over a parent reader.
///
/// Writes and erasures stay in the journal until they are merged into the
/// parent overlay (or handed to storage through `pending()`). Discarding an
/// overlay discards everything written through it.
class overlay final : public reader {
 public:
  explicit overlay(const reader& parent);

  std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const override;

  void write(const warden::schema::bytes_view_t& key,
             warden::schema::bytes_t value);
  void erase(const warden::schema::bytes_view_t& key);

  /// Fold a child overlay's journal into this one. The child must have been
  /// opened over this overlay.
  void merge(overlay&& child);

  /// Journal in key order, erasures as std::nullopt.
  std::vector<warden::storage::key_write_t> pending() const;

  void clear();
  bool empty() const;

 private:
  const reader* parent_;
  std::map<warden::schema::bytes_t, std::optional<warden::schema::bytes_t>>
      writes_;
};

/// Decode the value at key, or std::nullopt when absent.
template <typename T, typename Encoder>
std::optional<T> get(Encoder& encoder,
                     const reader& view,
                     const warden::schema::bytes_view_t& key) {
  auto raw = view.read(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder.template decode<T>(warden::schema::bytes_view_t{*raw});
}

template <typename T, typename Encoder>
void put(Encoder& encoder,
         overlay& view,
         const warden::schema::bytes_view_t& key,
         const T& value) {
  view.write(key, encoder.encode(value));
}

/// Overlay window whose keys are all rooted under a fixed prefix. Handed to
/// call targets so their state cannot collide with wallet state.
class prefixed_view final {
 public:
  prefixed_view(overlay& overlay, warden::schema::bytes_t prefix);

  std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const;
  void write(const warden::schema::bytes_view_t& key,
             warden::schema::bytes_t value);
  void erase(const warden::schema::bytes_view_t& key);

 private:
  warden::schema::bytes_t make_key(
      const warden::schema::bytes_view_t& key) const;

  overlay& overlay_;
  warden::schema::bytes_t prefix_;
};

}  // namespace warden::state
