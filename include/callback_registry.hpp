#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

struct CallbackResult {
  bool ok{true};
  std::string error;

  static CallbackResult success() { return CallbackResult{}; }
  static CallbackResult failure(std::string message) {
    return CallbackResult{false, std::move(message)};
  }
};

using FrameCallbackFn = std::function<CallbackResult(const FrameContext&, Seconds)>;

struct FrameCallback {
  std::string id;
  std::shared_ptr<const FrameCallbackFn> fn;  // shared by snapshots
  int priority{0};
  bool enabled{true};
  uint64_t sequence{0};  // registration order, breaks priority ties
  uint64_t failures{0};
};

// Entries are kept sorted by descending priority, then registration order.
// Unknown ids are ignored by every mutator. Not synchronized; FrameScheduler
// owns the lock.
class CallbackRegistry {
public:
  // Replacing an existing id keeps its original registration order.
  void register_callback(const std::string& id, FrameCallbackFn fn, int priority = 0);
  void unregister_callback(const std::string& id);
  void set_enabled(const std::string& id, bool enabled);
  void set_priority(const std::string& id, int priority);
  void note_failure(const std::string& id);
  void clear();

  // Enabled entries only, in execution order.
  std::vector<FrameCallback> snapshot() const;
  const std::vector<FrameCallback>& entries() const { return entries_; }

  size_t size() const { return entries_.size(); }
  size_t enabled_count() const;
  bool contains(const std::string& id) const;

private:
  std::vector<FrameCallback>::iterator find(const std::string& id);
  void sort_entries();

  std::vector<FrameCallback> entries_;
  uint64_t next_sequence_{0};
};
