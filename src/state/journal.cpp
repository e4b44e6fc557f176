#include <bastion/blake3/hash.hpp>
#include <bastion/common/critical.hpp>
#include <bastion/schema/key/state_keys.hpp>
#include <bastion/state/journal.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace bastion::state {

namespace {

bool has_prefix(const bastion::schema::bytes_t& key,
                const bastion::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(prefix.begin(), prefix.end(), key.begin());
}

}  // namespace

journal::journal(storage_t& store) : store_{store} {
  committed_ = store_.load_committed_state().value_or(
      bastion::storage::committed_state{});
}

journal::frame& journal::top() {
  if (frames_.empty()) {
    return staged_;
  }
  return frames_.back();
}

std::optional<bastion::schema::bytes_t> journal::get_raw(
    const bastion::schema::bytes_view_t& key) const {
  auto owned = bastion::schema::make_bytes(key);
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    auto found = it->writes.find(owned);
    if (found != it->writes.end()) {
      return found->second;
    }
  }
  auto found = staged_.writes.find(owned);
  if (found != staged_.writes.end()) {
    return found->second;
  }
  return store_.get_raw(key);
}

void journal::put_raw(const bastion::schema::bytes_view_t& key,
                      bastion::schema::bytes_t value) {
  top().writes[bastion::schema::make_bytes(key)] = std::move(value);
}

void journal::erase(const bastion::schema::bytes_view_t& key) {
  top().writes[bastion::schema::make_bytes(key)] = std::nullopt;
}

std::vector<bastion::storage::key_value_entry_t> journal::list_by_prefix(
    const bastion::schema::bytes_view_t& prefix) const {
  auto merged = std::map<bastion::schema::bytes_t, bastion::schema::bytes_t>{};
  for (auto& [key, value] : store_.list_by_prefix(prefix)) {
    merged.emplace(std::move(key), std::move(value));
  }
  auto overlay = [&](const frame& layer) {
    for (const auto& [key, value] : layer.writes) {
      if (!has_prefix(key, prefix)) {
        continue;
      }
      if (value) {
        merged[key] = *value;
      } else {
        merged.erase(key);
      }
    }
  };
  overlay(staged_);
  for (const auto& layer : frames_) {
    overlay(layer);
  }
  return {std::make_move_iterator(merged.begin()),
          std::make_move_iterator(merged.end())};
}

void journal::erase_prefix(const bastion::schema::bytes_view_t& prefix) {
  for (const auto& entry : list_by_prefix(prefix)) {
    erase(entry.first);
  }
}

void journal::emit(const bastion::schema::identity_t& emitter,
                   bastion::schema::event_t event) {
  top().events.emplace_back(emitter, std::move(event));
}

void journal::begin() {
  frames_.emplace_back();
}

void journal::commit() {
  if (frames_.empty()) {
    bastion::common::critical("journal commit without an open frame");
  }
  auto finished = std::move(frames_.back());
  frames_.pop_back();
  auto& parent = top();
  for (auto& [key, value] : finished.writes) {
    parent.writes[key] = std::move(value);
  }
  std::move(finished.events.begin(), finished.events.end(),
            std::back_inserter(parent.events));
}

void journal::rollback() {
  if (frames_.empty()) {
    bastion::common::critical("journal rollback without an open frame");
  }
  frames_.pop_back();
}

std::vector<bastion::schema::event_t> journal::staged_events() const {
  auto events = std::vector<bastion::schema::event_t>{};
  events.reserve(staged_.events.size());
  for (const auto& [emitter, event] : staged_.events) {
    events.push_back(event);
  }
  return events;
}

bastion::storage::committed_state journal::flush() {
  if (!frames_.empty()) {
    bastion::common::critical("journal flush with {} open frames",
                              frames_.size());
  }

  auto next = bastion::storage::committed_state{.height = committed_.height + 1,
                                                .state_root = {}};

  auto sequence_key = bastion::schema::key::make_event_sequence_key(encoder_);
  auto next_sequence = get<uint64_t>(sequence_key).value_or(0);
  for (auto& [emitter, event] : staged_.events) {
    auto record = bastion::schema::event_record_t{.sequence = next_sequence,
                                                  .height = next.height,
                                                  .emitter = emitter,
                                                  .event = std::move(event)};
    staged_.writes[bastion::schema::key::make_event_key(encoder_,
                                                        next_sequence)] =
        encoder_.encode(record);
    ++next_sequence;
  }
  if (!staged_.events.empty()) {
    staged_.writes[sequence_key] = encoder_.encode(next_sequence);
  }

  // Fold the ordered write set into the previous root.
  auto writes = std::vector<bastion::storage::write_entry_t>{
      std::make_move_iterator(staged_.writes.begin()),
      std::make_move_iterator(staged_.writes.end())};
  auto change_digest = bastion::blake3::hash_encoded(encoder_, writes);
  next.state_root = bastion::blake3::hash(
      {bastion::schema::bytes_view_t{committed_.state_root.data(),
                                     committed_.state_root.size()},
       bastion::schema::bytes_view_t{change_digest.data(),
                                     change_digest.size()}});

  store_.apply(writes, next);
  spdlog::debug("committed step {} with {} writes", next.height,
                writes.size());

  staged_ = frame{};
  committed_ = next;
  return next;
}

void journal::discard() {
  frames_.clear();
  staged_ = frame{};
}

}  // namespace bastion::state
