/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Lane Scheduler (Decision Cycle)                *
 **************************************************************/
#pragma once

#include "scheduler/DemandModel.h"
#include "scheduler/LaneTable.h"
#include "scheduler/LaneTypes.h"
#include "scheduler/SchedulerConfig.h"

/* DIAGNOSTIC VIEW RETURNED BY inspect() */
struct SchedulerStatus {
  const LaneState* lanes         = nullptr;
  uint8_t          count         = 0;
  int8_t           green         = -1; /* -1 = NO CURRENT GREEN */
  int8_t           lastEmergency = -1;
  uint32_t         greenStartMs  = 0;
  uint32_t         greenMs       = 0; /* CURRENT ALLOTMENT */
  float            yellowS       = 0.0f;
};

/*
 * ONE INTERSECTION'S DECISION LOOP.
 *
 * CYCLE (decide):
 *   MERGE READINGS -> EMERGENCY PREEMPTION -> (HOLD UNEXPIRED GREEN | FAIRNESS)
 *   -> WAIT AGING -> GREEN TIME -> RED/YELLOW/GREEN TRANSITION -> DEMAND MODEL
 *   -> REPORT
 *
 * NOT THREAD-SAFE: THE OWNER SERIALIZES EVERY CALL (ONE IN-FLIGHT CYCLE).
 * THE CALLER READS THE CLOCK ONCE PER CYCLE AND PASSES IT AS 'nowMs'.
 */
class LaneScheduler {
public:
  explicit LaneScheduler(const SchedulerConfig& cfg = SchedulerConfig::defaults());

  /**
   * REGISTER THE NEXT LANE (REGISTRATION ORDER IS FIXED FOR THE INSTANCE)
   *
   * @return SLOT INDEX, OR -1 IF FULL, DUPLICATE OR INVALID
   */
  int8_t registerLane(const char* id);

  /* REGISTER "Lane_1".."Lane_n" */
  uint8_t registerDefaultLanes(uint8_t n);

  /**
   * RUN ONE DECISION CYCLE
   *
   * @param readings  AUTHORITATIVE COUNTS FOR THIS CYCLE; REGISTERED LANES NOT
   *                  LISTED KEEP THEIR STORED COUNTS, UNKNOWN IDS ARE IGNORED
   * @param n         NUMBER OF READINGS
   * @param nowMs     WALL CLOCK (MS), READ ONCE BY THE CALLER
   * @param out       REPORT; EMPTY (count=0, chosen=-1) FOR AN EMPTY LANE SET
   * @return          CHOSEN LANE INDEX, -1 FOR AN EMPTY LANE SET
   */
  int8_t decide(const LaneReading* readings, uint8_t n, uint32_t nowMs, LaneReport& out);

  /* RUN ONE CYCLE ON THE STORED COUNTS ONLY (FEEDLESS SIMULATION) */
  int8_t decideRetained(uint32_t nowMs, LaneReport& out);

  /* TRUE WHILE THE CURRENT GREEN ALLOTMENT HAS NOT ELAPSED */
  bool greenActive(uint32_t nowMs) const;

  SchedulerStatus inspect() const;

  const SchedulerConfig& config() const {
    return cfg_;
  }
  const LaneTable& lanes() const {
    return table_;
  }
  DemandModel& demand() {
    return demand_;
  }
  uint32_t cycles() const {
    return cycles_;
  }

private:
  void sanitizeConfig_();
  void ageWaits_(int8_t chosen);
  void applyPhase_(int8_t chosen, uint32_t nowMs);
  void buildReport_(LaneReport& out, int8_t chosen, float greenS) const;
  void logCycle_(int8_t chosen, float greenS, const char* reason) const;

  SchedulerConfig cfg_;
  LaneTable       table_;
  DemandModel     demand_;

  /* GREEN PHASE */
  int8_t   green_        = -1;
  uint32_t greenStartMs_ = 0;
  uint32_t greenMs_      = 0;
  float    greenS_       = 0.0f;

  /* EMERGENCY ROUND-ROBIN MEMORY */
  int8_t lastEmergency_ = -1;

  uint32_t cycles_ = 0;
};
