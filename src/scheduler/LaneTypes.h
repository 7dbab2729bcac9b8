/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Lane Types (Shared By Core, Host And Mesh)     *
 **************************************************************/
#pragma once

#include <stddef.h>
#include <stdint.h>

/* =======================[ CAPACITY (OVERRIDE VIA -D ...) ]=======================
 *  -DSCHED_MAX_LANES=8         -> LANES PER INTERSECTION (<= 32)
 *  -DSCHED_LANE_ID_LEN=16      -> LANE ID BUFFER, INCLUDING NUL
 *  -DSCHED_LABEL_LEN=24        -> DETECTION LABEL BUFFER, INCLUDING NUL
 * ===============================================================================*/
#ifndef SCHED_MAX_LANES
  #define SCHED_MAX_LANES 8
#endif
#if (SCHED_MAX_LANES < 1) || (SCHED_MAX_LANES > 32)
  #error "SCHED_MAX_LANES must be in 1..32 (lane sets are tracked as 32-bit masks)"
#endif
#ifndef SCHED_LANE_ID_LEN
  #define SCHED_LANE_ID_LEN 16
#endif
#ifndef SCHED_LABEL_LEN
  #define SCHED_LABEL_LEN 24
#endif

#define SCHED_COUNT_MAX 0xFFFFu

/* =============================[ LANE PHASE ]===================================
 *  ONE-HOT PER INTERSECTION: EXACTLY ONE LANE IS GREEN AFTER A DECISION.
 *  YELLOW IS ONLY A TRANSIENT LABEL INSIDE THE TRANSITION.
 * ============================================================================*/
enum LanePhase : uint8_t { LP_RED = 0, LP_YELLOW, LP_GREEN };

static inline char lanePhaseChar(LanePhase p) {
  switch (p) {
    case LP_GREEN:
      return 'G';
    case LP_YELLOW:
      return 'Y';
    default:
      return 'R';
  }
}

static inline const char* lanePhaseName(LanePhase p) {
  switch (p) {
    case LP_GREEN:
      return "GREEN";
    case LP_YELLOW:
      return "YELLOW";
    default:
      return "RED";
  }
}

/* ==============================[ RECORDS ]==================================== */

/* ONE EXTERNAL READING (AUTHORITATIVE FOR THE CYCLE IT IS FED TO) */
struct LaneReading {
  char     id[SCHED_LANE_ID_LEN];
  uint16_t normal;
  uint16_t emergency;
};

/* STORED PER-LANE STATE */
struct LaneState {
  char      id[SCHED_LANE_ID_LEN];
  uint16_t  normal;
  uint16_t  emergency;
  uint16_t  wait; /* CYCLES SINCE LAST GREEN */
  LanePhase phase;
};

struct LaneReportEntry {
  char      id[SCHED_LANE_ID_LEN];
  LanePhase phase;
  uint16_t  wait;
  bool      hasGreenTime; /* ONLY THE CHOSEN LANE */
  float     greenTimeS;
};

struct LaneReport {
  uint8_t         count  = 0;
  int8_t          chosen = -1; /* -1 = EMPTY LANE SET */
  LaneReportEntry lanes[SCHED_MAX_LANES]{};
};

/* COPY A LANE ID, FAILS (WITHOUT TRUNCATING) IF IT DOES NOT FIT OR IS EMPTY */
static inline bool laneIdCopy(char* out, const char* in) {
  if (!in || !in[0])
    return false;
  size_t n = 0;
  while (in[n]) {
    if (++n >= SCHED_LANE_ID_LEN)
      return false;
  }
  for (size_t i = 0; i <= n; ++i)
    out[i] = in[i];
  return true;
}
