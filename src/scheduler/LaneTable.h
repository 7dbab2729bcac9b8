/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Lane Table (Per-Lane State Store)              *
 **************************************************************/
#pragma once

#include "scheduler/LaneTypes.h"

/*
 * FIXED-CAPACITY LANE STORE.
 *
 * - SLOT INDEX == REGISTRATION ORDER (USED FOR ROUND-ROBIN AND TIE-BREAKS).
 * - NO HEAP; LOOKUP IS A LINEAR SCAN (SCHED_MAX_LANES IS SMALL).
 */
class LaneTable {
public:
  LaneTable() = default;

  /**
   * REGISTER A LANE AT THE NEXT POSITION
   *
   * @param id  LANE ID (1..SCHED_LANE_ID_LEN-1 CHARS)
   * @return    SLOT INDEX, OR -1 IF FULL, DUPLICATE OR INVALID ID
   */
  int8_t add(const char* id);

  /**
   * FIND A LANE BY ID
   *
   * @return SLOT INDEX, OR -1 IF NOT REGISTERED
   */
  int8_t indexOf(const char* id) const;

  /**
   * TRUE IF THE DISTINCT IDS OF 'readings' ARE EXACTLY THE REGISTERED SET
   * (ORDER AND DUPLICATES IGNORED)
   */
  bool sameSet(const LaneReading* readings, uint8_t n) const;

  /* ZERO COUNTS/WAIT, ALL RED; KEEPS REGISTRATION */
  void resetAll();

  /* DROP EVERY LANE */
  void clear();

  uint8_t count() const {
    return count_;
  }
  LaneState& at(uint8_t i) {
    return lanes_[i];
  }
  const LaneState& at(uint8_t i) const {
    return lanes_[i];
  }
  const LaneState* data() const {
    return lanes_;
  }

private:
  LaneState lanes_[SCHED_MAX_LANES]{};
  uint8_t   count_ = 0;
};
