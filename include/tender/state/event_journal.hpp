#pragma once
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/schema/event.hpp>
#include <tender/schema/primitives.hpp>
#include <tender/storage/memory/storage.hpp>
#include <tender/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace tender::state {

struct journal_entry_t final {
  uint64_t sequence{};
  tender::schema::event_t event;
};

using event_sink_t = std::function<void(const tender::schema::event_t&)>;

/// Append-only log of every notification, folded into a running BLAKE3 root.
///
/// `commit` is the single write point for state changes that emit events:
/// the caller stages its rows in a batch, the journal appends its own rows
/// and the updated head, and the whole batch lands in one storage write.
/// Committed events wait in a queue until `publish`, which callers invoke
/// once they hold no locks of their own. Subscribers see events in sequence
/// order and may call back into the journal.
template <typename Storage>
class event_journal final {
 public:
  event_journal(tender::schema::encoding::scale_encoder_t& encoder,
                Storage& storage);

  /// Append `events` to `batch` and write the batch atomically. The events
  /// are queued for the next `publish`.
  void commit(tender::storage::write_batch& batch,
              const std::vector<tender::schema::event_t>& events);

  /// Deliver every queued event to the subscribers. A sink that throws is
  /// logged and skipped. A nested call from inside a sink returns at once;
  /// the outer call delivers whatever the sink committed.
  void publish();

  void subscribe(event_sink_t sink);

  /// Entries with `from <= sequence <= to`. Sequences start at 1.
  std::vector<journal_entry_t> events(uint64_t from, uint64_t to) const;

  tender::schema::hash32_t root() const;

  /// Sequence of the most recent entry, 0 when the journal is empty.
  uint64_t last_sequence() const;

 private:
  void load_head();

  mutable std::mutex mutex_;
  std::mutex delivery_mutex_;
  tender::schema::encoding::scale_encoder_t& encoder_;
  Storage& storage_;
  uint64_t next_sequence_{1};
  tender::schema::hash32_t root_{};
  std::vector<event_sink_t> sinks_;
  std::deque<tender::schema::event_t> pending_;
};

extern template class event_journal<tender::storage::rocksdb_storage_t>;
extern template class event_journal<tender::storage::memory_storage_t>;

}  // namespace tender::state
