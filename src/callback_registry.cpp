#include "callback_registry.hpp"

#include <algorithm>

void CallbackRegistry::register_callback(const std::string& id, FrameCallbackFn fn,
                                         int priority) {
  auto it = find(id);
  if (it != entries_.end()) {
    it->fn = std::make_shared<const FrameCallbackFn>(std::move(fn));
    it->priority = priority;
    it->enabled = true;
    it->failures = 0;
  } else {
    FrameCallback cb;
    cb.id = id;
    cb.fn = std::make_shared<const FrameCallbackFn>(std::move(fn));
    cb.priority = priority;
    cb.sequence = next_sequence_++;
    entries_.push_back(std::move(cb));
  }
  sort_entries();
}

void CallbackRegistry::unregister_callback(const std::string& id) {
  auto it = find(id);
  if (it != entries_.end()) entries_.erase(it);
}

void CallbackRegistry::set_enabled(const std::string& id, bool enabled) {
  auto it = find(id);
  if (it != entries_.end()) it->enabled = enabled;
}

void CallbackRegistry::set_priority(const std::string& id, int priority) {
  auto it = find(id);
  if (it == entries_.end() || it->priority == priority) return;
  it->priority = priority;
  sort_entries();
}

void CallbackRegistry::note_failure(const std::string& id) {
  auto it = find(id);
  if (it != entries_.end()) it->failures++;
}

void CallbackRegistry::clear() { entries_.clear(); }

std::vector<FrameCallback> CallbackRegistry::snapshot() const {
  std::vector<FrameCallback> out;
  out.reserve(entries_.size());
  for (const auto& cb : entries_) {
    if (cb.enabled) out.push_back(cb);
  }
  return out;
}

size_t CallbackRegistry::enabled_count() const {
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [](const FrameCallback& cb) { return cb.enabled; }));
}

bool CallbackRegistry::contains(const std::string& id) const {
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const FrameCallback& cb) { return cb.id == id; });
}

std::vector<FrameCallback>::iterator CallbackRegistry::find(const std::string& id) {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&](const FrameCallback& cb) { return cb.id == id; });
}

void CallbackRegistry::sort_entries() {
  std::sort(entries_.begin(), entries_.end(), [](const FrameCallback& a, const FrameCallback& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.sequence < b.sequence;
  });
}
