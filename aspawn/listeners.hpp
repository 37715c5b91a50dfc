#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace aspawn {

struct ListenerId {
 public:
  explicit ListenerId(uint64_t id) : _id(id) {}

  uint64_t to_int() const { return _id; }

  bool operator==(const ListenerId& other) const = default;

 private:
  uint64_t _id;
};

// Ordered list of subscribers for one event. Every subscriber sees every
// emission made while it is registered; subscribers added from inside a
// listener only see later emissions, and subscribers removed from inside a
// listener are not called again, not even by the emission in progress.
template <class... Args> struct Listeners {
 public:
  using listener = std::function<void(const Args&...)>;

  ListenerId add(listener&& fn) { return _add(std::move(fn), false); }

  // Removed before its first call.
  ListenerId once(listener&& fn) { return _add(std::move(fn), true); }

  bool remove(ListenerId id)
  {
    auto it = std::find_if(
      _entries.begin(), _entries.end(), [id](const Entry& entry) {
        return entry.id == id;
      });
    if (it == _entries.end()) { return false; }
    *it->active = false;
    _entries.erase(it);
    return true;
  }

  void emit(const Args&... args)
  {
    auto snapshot = _entries;
    for (auto& entry : snapshot) {
      if (!*entry.active) { continue; }
      if (entry.once) { remove(entry.id); }
      entry.fn(args...);
    }
  }

  void clear()
  {
    for (auto& entry : _entries) { *entry.active = false; }
    _entries.clear();
  }

  size_t size() const { return _entries.size(); }

  bool empty() const { return _entries.empty(); }

 private:
  struct Entry {
    ListenerId id;
    listener fn;
    bool once;
    std::shared_ptr<bool> active;
  };

  ListenerId _add(listener&& fn, bool once)
  {
    auto id = ListenerId(_next_id++);
    _entries.push_back(Entry{
      .id = id,
      .fn = std::move(fn),
      .once = once,
      .active = std::make_shared<bool>(true),
    });
    return id;
  }

  std::vector<Entry> _entries;
  uint64_t _next_id = 1;
};

} // namespace aspawn
