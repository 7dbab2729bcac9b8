/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Demand Evolution Model                         *
 **************************************************************/
#pragma once

#include "scheduler/LaneTypes.h"
#include "scheduler/SchedulerConfig.h"

/* ARRIVAL SOURCE HOOK: RETURNS NEW VEHICLES FOR ONE LANE (CLAMPED TO SCHED_MAX_ARRIVALS) */
typedef uint8_t (*ArrivalFn)(void* ctx);

/*
 * SYNTHETIC QUEUE MODEL APPLIED AFTER EACH PHASE TRANSITION:
 *
 *  - CHOSEN LANE: LOSES min(normal, floor(clearanceRate * greenS)) VEHICLES
 *  - OTHER LANES: GAIN 0..SCHED_MAX_ARRIVALS VEHICLES
 *
 * ARRIVALS COME FROM A SEEDABLE XORSHIFT32 UNLESS A HOOK IS INSTALLED.
 */
class DemandModel {
public:
  explicit DemandModel(uint32_t seed = SCHED_DEMAND_SEED);

  /* RESTART THE BUILT-IN GENERATOR (0 IS REMAPPED, XORSHIFT NEVER LEAVES 0) */
  void seed(uint32_t s);

  /**
   * INSTALL AN ARRIVAL SOURCE
   *
   * @param fn   HOOK, OR nullptr TO RETURN TO THE BUILT-IN GENERATOR
   * @param ctx  OPAQUE POINTER HANDED BACK TO 'fn'
   */
  void setArrivalSource(ArrivalFn fn, void* ctx);

  /* NEXT ARRIVAL COUNT, ALWAYS IN 0..SCHED_MAX_ARRIVALS */
  uint8_t nextArrivals();

  /* VEHICLES THE CHOSEN LANE CLEARS DURING 'greenS' */
  static uint16_t cleared(uint16_t normal, float greenS, float clearanceRate);

  /**
   * EVOLVE ONE CYCLE IN PLACE
   *
   * @param lanes   WORKING SNAPSHOT (ONLY 'normal' IS TOUCHED)
   * @param chosen  LANE THAT RECEIVED GREEN
   */
  void evolve(LaneState* lanes, uint8_t count, int8_t chosen, float greenS, float clearanceRate);

private:
  uint32_t  state_ = SCHED_DEMAND_SEED;
  ArrivalFn fn_    = nullptr;
  void*     ctx_   = nullptr;
};
