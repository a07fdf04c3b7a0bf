#include <warden/common/critical.hpp>
#include <warden/state/overlay.hpp>

#include <iterator>
#include <utility>

using namespace warden::schema;

namespace warden::state {

overlay::overlay(const reader& parent) : parent_{&parent} {}

std::optional<bytes_t> overlay::read(const bytes_view_t& key) const {
  auto it = writes_.find(make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  return parent_->read(key);
}

void overlay::write(const bytes_view_t& key, bytes_t value) {
  writes_[make_bytes(key)] = std::move(value);
}

void overlay::erase(const bytes_view_t& key) {
  writes_[make_bytes(key)] = std::nullopt;
}

void overlay::merge(overlay&& child) {
  if (child.parent_ != this) {
    warden::common::critical("overlay merged into a foreign parent");
  }
  for (auto& [key, value] : child.writes_) {
    writes_[key] = std::move(value);
  }
  child.writes_.clear();
}

std::vector<warden::storage::key_write_t> overlay::pending() const {
  return {std::begin(writes_), std::end(writes_)};
}

void overlay::clear() {
  writes_.clear();
}

bool overlay::empty() const {
  return writes_.empty();
}

prefixed_view::prefixed_view(overlay& overlay, bytes_t prefix)
    : overlay_{overlay}, prefix_{std::move(prefix)} {}

std::optional<bytes_t> prefixed_view::read(const bytes_view_t& key) const {
  auto full = make_key(key);
  return overlay_.read(bytes_view_t{full});
}

void prefixed_view::write(const bytes_view_t& key, bytes_t value) {
  auto full = make_key(key);
  overlay_.write(bytes_view_t{full}, std::move(value));
}

void prefixed_view::erase(const bytes_view_t& key) {
  auto full = make_key(key);
  overlay_.erase(bytes_view_t{full});
}

bytes_t prefixed_view::make_key(const bytes_view_t& key) const {
  auto full = prefix_;
  full.insert(std::end(full), std::begin(key), std::end(key));
  return full;
}

}  // namespace warden::state
