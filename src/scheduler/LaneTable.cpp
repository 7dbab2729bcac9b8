/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Lane Table (Per-Lane State Store)              *
 **************************************************************/

#include "scheduler/LaneTable.h"

#include <string.h>

int8_t LaneTable::add(const char* id) {
  if (count_ >= SCHED_MAX_LANES)
    return -1;
  if (indexOf(id) >= 0)
    return -1;

  LaneState& l = lanes_[count_];
  if (!laneIdCopy(l.id, id))
    return -1;
  l.normal    = 0;
  l.emergency = 0;
  l.wait      = 0;
  l.phase     = LP_RED;
  return (int8_t) count_++;
}

int8_t LaneTable::indexOf(const char* id) const {
  if (!id)
    return -1;
  for (uint8_t i = 0; i < count_; ++i)
    if (strncmp(lanes_[i].id, id, SCHED_LANE_ID_LEN) == 0)
      return (int8_t) i;
  return -1;
}

bool LaneTable::sameSet(const LaneReading* readings, uint8_t n) const {
  /* EVERY REGISTERED LANE SEEN AT LEAST ONCE, AND NOTHING UNKNOWN */
  uint32_t seen = 0;
  for (uint8_t k = 0; k < n; ++k) {
    const int8_t i = indexOf(readings[k].id);
    if (i < 0)
      return false;
    seen |= (1UL << (uint8_t) i);
  }
  const uint32_t all = (count_ >= 32) ? 0xFFFFFFFFUL : ((1UL << count_) - 1UL);
  return seen == all;
}

void LaneTable::resetAll() {
  for (uint8_t i = 0; i < count_; ++i) {
    lanes_[i].normal    = 0;
    lanes_[i].emergency = 0;
    lanes_[i].wait      = 0;
    lanes_[i].phase     = LP_RED;
  }
}

void LaneTable::clear() {
  memset(lanes_, 0, sizeof(lanes_));
  count_ = 0;
}
