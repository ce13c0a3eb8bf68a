#pragma once

namespace safekeeper::ledger {

/// Scoped in-progress flag. The first guard on a flag acquires it and
/// clears it on destruction; nested guards on the same flag do not.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& entered)
      : entered_{entered}, acquired_{!entered} {
    if (acquired_) {
      entered_ = true;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&&) = delete;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;

  ~reentrancy_guard() {
    if (acquired_) {
      entered_ = false;
    }
  }

  bool acquired() const { return acquired_; }

 private:
  bool& entered_;
  bool acquired_;
};

}  // namespace safekeeper::ledger
