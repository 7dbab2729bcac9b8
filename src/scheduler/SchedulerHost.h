/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Scheduler Host (Lane-Set Owner + Dispatcher)   *
 **************************************************************/
#pragma once

#include "scheduler/DetectionAggregator.h"
#include "scheduler/LaneScheduler.h"
#include "scheduler/SchedFrame.h"

/*
 * OWNS ONE LaneScheduler PER INTERSECTION.
 *
 * - A NEW CORE IS CREATED WHEN NONE EXISTS OR WHEN THE INCOMING LANE-ID SET
 *   DIFFERS FROM THE REGISTERED ONE (ORDER-INSENSITIVE); ALL STATE RESTARTS.
 * - LANES ARE REGISTERED IN READING ORDER (FIRST OCCURRENCE OF DUPLICATES).
 * - THE ARRIVAL HOOK AND SEED SURVIVE A RESET.
 *
 * NOT THREAD-SAFE; THE MESH MODULE CALLS IT ONLY FROM THE COOPERATIVE MAIN LOOP.
 */
class SchedulerHost {
public:
  explicit SchedulerHost(const SchedulerConfig& cfg = SchedulerConfig::hostDefaults());

  /**
   * DECIDE ON EXTERNAL COUNTS
   *
   * @return CHOSEN LANE INDEX, -1 FOR AN EMPTY LANE SET
   */
  int8_t update(const LaneReading* readings, uint8_t n, uint32_t nowMs, LaneReport& out);

  /* AGGREGATE DETECTIONS INTO COUNTS, THEN update() */
  int8_t predictAndUpdate(const Detection* d, uint16_t n, uint32_t nowMs, LaneReport& out);

  /* REGISTER "Lane_1".."Lane_n" FOR FEEDLESS OPERATION */
  uint8_t beginStandalone(uint8_t n);

  /* ONE FEEDLESS CYCLE ON THE RETAINED COUNTS */
  int8_t simulateStep(uint32_t nowMs, LaneReport& out);

  /**
   * HANDLE ONE REQUEST FRAME
   *
   * @param lineZ    NUL-TERMINATED FRAME
   * @param nowMs    WALL CLOCK (MS)
   * @param reply    OUT: SEALED R / S / E FRAME
   * @param replySz  SIZE OF 'reply'
   * @return         REPLY LENGTH, 0 = NO REPLY (BAD CHECKSUM OR FRAMING);
   *                 A REPLY THAT DOES NOT FIT 'replySz' BECOMES E,TOO_LONG
   */
  size_t handleLine(const char* lineZ, uint32_t nowMs, char* reply, size_t replySz);

  /* SEALED R FRAME OF A REPORT, BUMPS THE SEQUENCE */
  size_t encodeReport(const LaneReport& r, char* out, size_t outSz);

  void setArrivalSource(ArrivalFn fn, void* ctx);
  void seedDemand(uint32_t seed);
  void setClassifier(ClassifyFn fn, void* ctx) {
    agg_.setClassifier(fn, ctx);
  }

  bool live() const {
    return live_;
  }
  uint32_t resets() const {
    return resets_;
  }
  uint32_t seq() const {
    return seq_;
  }
  const DetectionAggregator& aggregator() const {
    return agg_;
  }
  const LaneScheduler& scheduler() const {
    return core_;
  }

private:
  void instantiate_(const LaneReading* readings, uint8_t n);
  void applyDemandHooks_();
  size_t replyOrTooLong_(size_t len, char type, char* reply, size_t replySz) const;

  SchedulerConfig     cfg_;
  LaneScheduler       core_;
  DetectionAggregator agg_;
  bool                live_   = false;
  uint32_t            resets_ = 0;
  uint32_t            seq_    = 0;

  /* DEMAND HOOKS, RE-APPLIED TO EVERY NEW CORE */
  ArrivalFn arrivalFn_  = nullptr;
  void*     arrivalCtx_ = nullptr;
  uint32_t  seed_       = SCHED_DEMAND_SEED;

  /* WORK BUFFERS (KEPT OFF THE STACK) */
  LaneReading readBuf_[SCHED_MAX_LANES];
  Detection   detBuf_[SCHED_MAX_DETECTIONS];
  LaneReport  report_;
};
