/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Scheduler Configuration                        *
 **************************************************************/
#pragma once

#include <stdint.h>

/* =======================[ DEFAULT CONFIG (OVERRIDE VIA -D ...) ]=======================
 *  TIMING (SECONDS):
 *    -DSCHED_MIN_GREEN_S=3.0        -> LOWER CLAMP OF ANY GREEN ALLOTMENT
 *    -DSCHED_MAX_GREEN_S=15.0       -> UPPER CLAMP OF ANY GREEN ALLOTMENT
 *    -DSCHED_YELLOW_S=2.0           -> ADVISORY ONLY, NEVER DELAYS A TRANSITION
 *
 *  FAIRNESS:
 *    -DSCHED_WAIT_BOOST=0.4         -> SCORE GROWTH PER WAITED CYCLE
 *    -DSCHED_STARVATION_LIMIT=8     -> CYCLES AFTER WHICH A LANE IS FORCED
 *    -DSCHED_STARVATION_BONUS=1000
 *
 *  DEMAND:
 *    -DSCHED_CLEARANCE_RATE=3.0     -> VEHICLES SERVED PER SECOND OF GREEN
 *    -DSCHED_MAX_ARRIVALS=3         -> UPPER BOUND OF RANDOM ARRIVALS PER CYCLE
 *    -DSCHED_DEMAND_SEED=0xA5A5F00D
 *
 *  HOST DEFAULTS (VALUES THE INTERSECTION SERVICE RUNS WITH):
 *    -DSCHED_HOST_MIN_GREEN_S=3.0
 *    -DSCHED_HOST_MAX_GREEN_S=12.0
 *    -DSCHED_HOST_YELLOW_S=2.0
 *    -DSCHED_HOST_CLEARANCE_RATE=2.5
 * =====================================================================================*/

#ifndef SCHED_MIN_GREEN_S
  #define SCHED_MIN_GREEN_S 3.0f
#endif
#ifndef SCHED_MAX_GREEN_S
  #define SCHED_MAX_GREEN_S 15.0f
#endif
#ifndef SCHED_YELLOW_S
  #define SCHED_YELLOW_S 2.0f
#endif
#ifndef SCHED_WAIT_BOOST
  #define SCHED_WAIT_BOOST 0.4f
#endif
#ifndef SCHED_STARVATION_LIMIT
  #define SCHED_STARVATION_LIMIT 8
#endif
#ifndef SCHED_STARVATION_BONUS
  #define SCHED_STARVATION_BONUS 1000.0f
#endif
#ifndef SCHED_CLEARANCE_RATE
  #define SCHED_CLEARANCE_RATE 3.0f
#endif
#ifndef SCHED_MAX_ARRIVALS
  #define SCHED_MAX_ARRIVALS 3
#endif
#ifndef SCHED_DEMAND_SEED
  #define SCHED_DEMAND_SEED 0xA5A5F00DUL
#endif

/* --- ESTIMATOR CONSTANTS (SEPARATE KNOBS FROM SCHED_WAIT_BOOST) --- */
#ifndef SCHED_GREEN_WAIT_BONUS_S
  #define SCHED_GREEN_WAIT_BONUS_S 0.4f
#endif
#ifndef SCHED_GREEN_EMERGENCY_BONUS_S
  #define SCHED_GREEN_EMERGENCY_BONUS_S 2.0f
#endif

/* --- HOST --- */
#ifndef SCHED_HOST_MIN_GREEN_S
  #define SCHED_HOST_MIN_GREEN_S 3.0f
#endif
#ifndef SCHED_HOST_MAX_GREEN_S
  #define SCHED_HOST_MAX_GREEN_S 12.0f
#endif
#ifndef SCHED_HOST_YELLOW_S
  #define SCHED_HOST_YELLOW_S 2.0f
#endif
#ifndef SCHED_HOST_CLEARANCE_RATE
  #define SCHED_HOST_CLEARANCE_RATE 2.5f
#endif

struct SchedulerConfig {
  float    minGreenS       = SCHED_MIN_GREEN_S;
  float    maxGreenS       = SCHED_MAX_GREEN_S;
  float    yellowS         = SCHED_YELLOW_S;
  float    waitBoost       = SCHED_WAIT_BOOST;
  uint16_t starvationLimit = SCHED_STARVATION_LIMIT;
  float    clearanceRate   = SCHED_CLEARANCE_RATE;

  static SchedulerConfig defaults() {
    return SchedulerConfig();
  }

  static SchedulerConfig hostDefaults() {
    SchedulerConfig c;
    c.minGreenS     = SCHED_HOST_MIN_GREEN_S;
    c.maxGreenS     = SCHED_HOST_MAX_GREEN_S;
    c.yellowS       = SCHED_HOST_YELLOW_S;
    c.clearanceRate = SCHED_HOST_CLEARANCE_RATE;
    return c;
  }
};
