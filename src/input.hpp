#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: Normal mode key prefixes: numeric count ("5j") and the "gg" double key.
 * Note: knows nothing about panes; Browser decides what a completed prefix means.
 */

class Input {
public:
  bool consumeGg(int ch);
  bool consumeDigit(int ch);
  bool hasCount() const;
  // count or 1 when none was typed; clears the count
  int takeCount();
  void reset();
private:
  bool pending_g_ = false;
  int pending_count_ = 0;
};
