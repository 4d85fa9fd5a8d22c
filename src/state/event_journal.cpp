#include <spdlog/spdlog.h>
#include <tender/blake3/hash.hpp>
#include <tender/schema/key/keys.hpp>
#include <tender/state/event_journal.hpp>
#include <exception>
#include <tuple>
#include <utility>

using namespace tender::schema;

namespace {

using head_record_t = std::tuple<uint64_t, hash32_t>;

hash32_t fold_journal_root(tender::schema::encoding::scale_encoder_t& encoder,
                           const hash32_t& root,
                           uint64_t sequence,
                           const bytes_t& encoded_event) {
  auto encoded_sequence = encoder.encode(sequence);
  return tender::blake3::hasher{}
      .update(bytes_view_t{root.data(), root.size()})
      .update(bytes_view_t{encoded_sequence.data(), encoded_sequence.size()})
      .update(bytes_view_t{encoded_event.data(), encoded_event.size()})
      .finalize();
}

uint64_t sequence_of(const bytes_t& key) {
  auto prefix_size = key::kEventPrefix.size();
  if (key.size() != prefix_size + sizeof(uint64_t)) {
    tender::common::critical("malformed event key");
  }
  auto sequence = uint64_t{0};
  for (auto i = prefix_size; i < key.size(); ++i) {
    sequence = (sequence << 8) | key[i];
  }
  return sequence;
}

// Journal currently delivering on this thread.
thread_local const void* delivering_journal = nullptr;

struct delivery_scope final {
  explicit delivery_scope(const void* journal) : previous{delivering_journal} {
    delivering_journal = journal;
  }
  ~delivery_scope() { delivering_journal = previous; }
  delivery_scope(const delivery_scope&) = delete;
  delivery_scope& operator=(const delivery_scope&) = delete;

  const void* previous;
};

}  // namespace

namespace tender::state {

template <typename Storage>
event_journal<Storage>::event_journal(
    tender::schema::encoding::scale_encoder_t& encoder,
    Storage& storage)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_head();
}

template <typename Storage>
void event_journal<Storage>::commit(tender::storage::write_batch& batch,
                                    const std::vector<event_t>& events) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence = next_sequence_;
  auto root = root_;
  for (const auto& event : events) {
    auto encoded = encoder_.encode(event);
    root = fold_journal_root(encoder_, root, sequence, encoded);
    batch.put(key::make_event_key(sequence), std::move(encoded));
    ++sequence;
  }
  if (!events.empty()) {
    batch.put(encoder_, key::make_event_head_key(),
              head_record_t{sequence, root});
  }

  storage_.write(batch);

  next_sequence_ = sequence;
  root_ = root;
  if (!sinks_.empty()) {
    pending_.insert(std::end(pending_), std::begin(events), std::end(events));
  }
}

template <typename Storage>
void event_journal<Storage>::publish() {
  if (delivering_journal == this) {
    return;
  }
  auto delivery = std::scoped_lock{delivery_mutex_};
  auto scope = delivery_scope{this};
  while (true) {
    auto event = event_t{};
    auto sinks = std::vector<event_sink_t>{};
    {
      auto lock = std::scoped_lock{mutex_};
      if (pending_.empty()) {
        break;
      }
      event = std::move(pending_.front());
      pending_.pop_front();
      sinks = sinks_;
    }
    for (const auto& sink : sinks) {
      try {
        sink(event);
      } catch (const std::exception& ex) {
        spdlog::error("Event subscriber failed on {}: {}", event.type,
                      ex.what());
      }
    }
  }
}

template <typename Storage>
void event_journal<Storage>::subscribe(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  sinks_.push_back(std::move(sink));
}

template <typename Storage>
std::vector<journal_entry_t> event_journal<Storage>::events(
    uint64_t from,
    uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<journal_entry_t>{};
  if (from == 0) {
    from = 1;
  }
  if (to >= next_sequence_) {
    to = next_sequence_ - 1;
  }
  if (from > to) {
    return entries;
  }

  auto prefix = make_bytes(key::kEventPrefix);
  auto expected = from;
  for (const auto& [event_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto sequence = sequence_of(event_key);
    if (sequence < from) {
      continue;
    }
    if (sequence > to) {
      break;
    }
    if (sequence != expected) {
      tender::common::critical("event journal has a gap at {}", expected);
    }
    entries.push_back(journal_entry_t{
        .sequence = sequence,
        .event = encoder_.template decode<event_t>(
            bytes_view_t{value.data(), value.size()})});
    ++expected;
  }
  if (expected != to + 1) {
    tender::common::critical("event journal has a gap at {}", expected);
  }
  return entries;
}

template <typename Storage>
hash32_t event_journal<Storage>::root() const {
  auto lock = std::scoped_lock{mutex_};
  return root_;
}

template <typename Storage>
uint64_t event_journal<Storage>::last_sequence() const {
  auto lock = std::scoped_lock{mutex_};
  return next_sequence_ - 1;
}

template <typename Storage>
void event_journal<Storage>::load_head() {
  auto key = key::make_event_head_key();
  auto head = storage_.template get<head_record_t>(
      encoder_, bytes_view_t{key.data(), key.size()});
  if (!head) {
    return;
  }
  std::tie(next_sequence_, root_) = *head;
  spdlog::info("Loaded event journal at sequence {} root {}",
               next_sequence_ - 1, to_string(root_));
}

template class event_journal<tender::storage::rocksdb_storage_t>;
template class event_journal<tender::storage::memory_storage_t>;

}  // namespace tender::state
