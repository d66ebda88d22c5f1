#include <spdlog/spdlog.h>
#include <algorithm>
#include <courier/blake3/hash.hpp>
#include <courier/common/critical.hpp>
#include <courier/ledger/state.hpp>
#include <courier/schema/key/ledger_keys.hpp>
#include <iterator>
#include <tuple>

using namespace courier::schema;

namespace {

bool starts_with(const bytes_t& key, const bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

// Tombstones are folded as a single marker byte so a delete and a put of an
// empty value produce different roots.
hash32_t fold_state_root(
    const hash32_t& seed,
    uint64_t height,
    const std::map<bytes_t, std::optional<bytes_t>>& writes,
    courier::ledger::encoder_t& encoder) {
  auto hasher = courier::blake3::hasher{};
  hasher.update(bytes_view_t{seed.data(), seed.size()});
  auto chunk = encoder.encode(height);
  hasher.update(bytes_view_t{chunk.data(), chunk.size()});
  for (const auto& [key, value] : writes) {
    chunk.clear();
    encoder.encode(key, chunk);
    if (value.has_value()) {
      chunk.push_back(1);
      encoder.encode(*value, chunk);
    } else {
      chunk.push_back(0);
    }
    hasher.update(bytes_view_t{chunk.data(), chunk.size()});
  }
  return hasher.finalize();
}

}  // namespace

namespace courier::ledger {

state::state(storage_t& storage) : storage_{storage} {
  auto committed = storage_.load_committed_state();
  if (committed.has_value()) {
    committed_ = *committed;
    spdlog::info("Ledger resumed at height {} with state root {}",
                 committed_.height, to_hex(committed_.state_root));
  } else {
    committed_ = courier::storage::committed_state{
        .height = 0, .state_root = make_zero_hash()};
    spdlog::info("Ledger initialized at genesis");
  }
}

transaction state::begin() {
  if (open_) {
    courier::common::critical("nested ledger transaction");
  }
  open_ = true;
  pending_.clear();
  return transaction{*this};
}

bool state::in_transaction() const {
  return open_;
}

std::optional<bytes_t> state::load(const bytes_view_t& key) const {
  if (open_) {
    auto it = pending_.find(make_bytes(key));
    if (it != std::end(pending_)) {
      return it->second;
    }
  }
  return storage_.load(key);
}

void state::store(const bytes_view_t& key, bytes_t value) {
  require_open("store");
  pending_[make_bytes(key)] = std::move(value);
}

void state::erase(const bytes_view_t& key) {
  require_open("erase");
  pending_[make_bytes(key)] = std::nullopt;
}

bool state::contains(const bytes_view_t& key) const {
  return load(key).has_value();
}

std::vector<courier::storage::key_value_entry_t> state::list_by_prefix(
    const bytes_view_t& prefix) const {
  auto merged = std::map<bytes_t, bytes_t>{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged.emplace(std::move(key), std::move(value));
  }
  if (open_) {
    for (const auto& [key, value] : pending_) {
      if (!starts_with(key, prefix)) {
        continue;
      }
      if (value.has_value()) {
        merged.insert_or_assign(key, *value);
      } else {
        merged.erase(key);
      }
    }
  }

  auto entries = std::vector<courier::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

uint64_t state::emit(const transaction_event_t& event) {
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto sequence_view = bytes_view_t{sequence_key.data(), sequence_key.size()};
  auto next = get<uint64_t>(sequence_view).value_or(1);
  auto event_key = key::make_event_key(encoder_, next);
  put(bytes_view_t{event_key.data(), event_key.size()}, event);
  put(sequence_view, next + 1);
  return next;
}

std::vector<transaction_event_t> state::events(uint64_t from_id,
                                               uint64_t to_id) const {
  auto prefix = key::make_event_prefix_key(encoder_);
  auto ordered = std::map<uint64_t, transaction_event_t>{};
  for (const auto& [key, value] :
       list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto id = key::parse_event_key(encoder_,
                                   bytes_view_t{key.data(), key.size()});
    if (!id.has_value() || *id < from_id || *id > to_id) {
      continue;
    }
    ordered.emplace(*id, encoder_.decode<transaction_event_t>(
                             bytes_view_t{value.data(), value.size()}));
  }

  auto out = std::vector<transaction_event_t>{};
  out.reserve(ordered.size());
  for (auto& [id, event] : ordered) {
    out.push_back(std::move(event));
  }
  return out;
}

uint64_t state::height() const {
  return committed_.height;
}

const hash32_t& state::state_root() const {
  return committed_.state_root;
}

encoder_t& state::encoder() const {
  return encoder_;
}

uint64_t state::commit() {
  require_open("commit");
  auto next = courier::storage::committed_state{
      .height = committed_.height + 1,
      .state_root = fold_state_root(committed_.state_root,
                                    committed_.height + 1, pending_, encoder_)};

  auto writes = std::vector<courier::storage::write_entry_t>{};
  writes.reserve(pending_.size());
  for (auto& [key, value] : pending_) {
    writes.emplace_back(key, std::move(value));
  }
  storage_.apply(writes, next);

  spdlog::debug("Ledger committed height {} ({} write(s))", next.height,
                writes.size());
  committed_ = next;
  pending_.clear();
  open_ = false;
  return committed_.height;
}

void state::rollback() {
  if (!open_) {
    return;
  }
  spdlog::debug("Ledger rolled back {} staged write(s)", pending_.size());
  pending_.clear();
  open_ = false;
}

void state::require_open(const std::string_view operation) const {
  if (!open_) {
    spdlog::error("Ledger {} attempted outside of a transaction", operation);
    courier::common::critical("ledger write outside transaction");
  }
}

transaction::transaction(state& ledger) : ledger_{ledger} {}

transaction::~transaction() {
  if (!finished_) {
    ledger_.rollback();
  }
}

uint64_t transaction::commit() {
  if (finished_) {
    courier::common::critical("ledger transaction committed twice");
  }
  finished_ = true;
  return ledger_.commit();
}

}  // namespace courier::ledger
