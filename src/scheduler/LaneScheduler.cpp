/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Lane Scheduler (Decision Cycle)                *
 **************************************************************/

#include "scheduler/LaneScheduler.h"

#include <stdio.h>
#include <string.h>

#include "scheduler/LaneSelectors.h"

#define LOG_TAG "sched_core"
#include "scheduler/SchedLog.h"

/* ================================== CONSTRUCTOR ================================== */
LaneScheduler::LaneScheduler(const SchedulerConfig& cfg) : cfg_(cfg) {
  sanitizeConfig_();
}

void LaneScheduler::sanitizeConfig_() {
  if (!(cfg_.clearanceRate > 0.0f)) {
    SCHED_LOGW("config: clearanceRate=%.2f invalid -> %.2f\n",
               (double) cfg_.clearanceRate,
               (double) SCHED_CLEARANCE_RATE);
    cfg_.clearanceRate = SCHED_CLEARANCE_RATE;
  }
  if (cfg_.minGreenS < 0.0f) {
    SCHED_LOGW("config: minGreen=%.2f negative -> 0\n", (double) cfg_.minGreenS);
    cfg_.minGreenS = 0.0f;
  }
  if (cfg_.maxGreenS < cfg_.minGreenS) {
    SCHED_LOGW("config: maxGreen=%.2f < minGreen=%.2f -> raised\n",
               (double) cfg_.maxGreenS,
               (double) cfg_.minGreenS);
    cfg_.maxGreenS = cfg_.minGreenS;
  }
}

/* ================================== REGISTRATION ================================= */
int8_t LaneScheduler::registerLane(const char* id) {
  const int8_t i = table_.add(id);
  if (i < 0)
    SCHED_LOGW("register: lane '%s' rejected (full, duplicate or bad id)\n", id ? id : "");
  return i;
}

uint8_t LaneScheduler::registerDefaultLanes(uint8_t n) {
  uint8_t added = 0;
  char    id[SCHED_LANE_ID_LEN];
  for (uint8_t k = 0; k < n; ++k) {
    snprintf(id, sizeof(id), "Lane_%u", (unsigned) (k + 1));
    if (registerLane(id) >= 0)
      added++;
  }
  return added;
}

/* ==================================== TIMING ===================================== */
bool LaneScheduler::greenActive(uint32_t nowMs) const {
  if (green_ < 0)
    return false;
  return (int32_t) (nowMs - greenStartMs_) < (int32_t) greenMs_;
}

/* ================================= WAIT AGING ==================================== */
void LaneScheduler::ageWaits_(int8_t chosen) {
  for (uint8_t i = 0; i < table_.count(); ++i) {
    LaneState& l = table_.at(i);
    if ((int8_t) i == chosen)
      l.wait = 0;
    else if (l.wait < SCHED_COUNT_MAX)
      l.wait++;
  }
}

/* =============================== PHASE TRANSITION ================================ */
/*
 * ALL RED -> CHOSEN YELLOW -> CHOSEN GREEN, IN ONE STEP.
 * YELLOW IS NEVER HELD FOR yellowS; THE LABEL IS OVERWRITTEN IMMEDIATELY.
 */
void LaneScheduler::applyPhase_(int8_t chosen, uint32_t nowMs) {
  for (uint8_t i = 0; i < table_.count(); ++i)
    table_.at(i).phase = LP_RED;

  table_.at((uint8_t) chosen).phase = LP_YELLOW;
  table_.at((uint8_t) chosen).phase = LP_GREEN;

  green_        = chosen;
  greenStartMs_ = nowMs;
}

/* ================================ DECISION CYCLE ================================= */
int8_t LaneScheduler::decide(const LaneReading* readings,
                             uint8_t            n,
                             uint32_t           nowMs,
                             LaneReport&        out) {
  const uint8_t count = table_.count();
  if (count == 0) {
    out.count  = 0;
    out.chosen = -1;
    SCHED_LOGW("decide: empty lane set\n");
    return -1;
  }

  /* 1) MERGE: READINGS ARE AUTHORITATIVE, WAIT IS RETAINED */
  LaneState work[SCHED_MAX_LANES];
  memcpy(work, table_.data(), sizeof(LaneState) * count);
  for (uint8_t k = 0; k < n; ++k) {
    const int8_t i = table_.indexOf(readings[k].id);
    if (i < 0) {
      SCHED_LOGW("decide: unknown lane '%s' ignored\n", readings[k].id);
      continue;
    }
    work[i].normal    = readings[k].normal;
    work[i].emergency = readings[k].emergency;
  }

  /* 2) EMERGENCY PREEMPTION */
  bool       hold      = false;
  int8_t     chosen    = SEL_emergencyLane(work, count, lastEmergency_);
  const bool emergency = (chosen >= 0);

  /* 3) HOLD AN UNEXPIRED GREEN, ELSE FAIRNESS */
  if (!emergency) {
    if (greenActive(nowMs)) {
      chosen = green_;
      hold   = true;
    } else {
      chosen = SEL_fairLane(work, count, cfg_);
    }
  }

  /* 4) AGING */
  ageWaits_(chosen);

  /* 5+6) GREEN TIME AND TRANSITION, EVERY CYCLE (A HELD LANE IS RE-GRANTED FROM NOW) */
  greenS_  = SEL_greenTimeS(work[chosen], cfg_);
  greenMs_ = (uint32_t) (greenS_ * 1000.0f + 0.5f);
  applyPhase_(chosen, nowMs);

  /* 7) DEMAND MODEL ON THE WORKING SNAPSHOT, PERSISTED BACK */
  demand_.evolve(work, count, chosen, greenS_, cfg_.clearanceRate);
  for (uint8_t i = 0; i < count; ++i) {
    table_.at(i).normal    = work[i].normal;
    table_.at(i).emergency = work[i].emergency;
  }

  cycles_++;

  /* 8) REPORT */
  buildReport_(out, chosen, greenS_);
  logCycle_(chosen, greenS_, emergency ? "EMERGENCY" : (hold ? "HOLD" : "FAIR"));
  return chosen;
}

int8_t LaneScheduler::decideRetained(uint32_t nowMs, LaneReport& out) {
  return decide(nullptr, 0, nowMs, out);
}

/* ==================================== REPORT ===================================== */
void LaneScheduler::buildReport_(LaneReport& out, int8_t chosen, float greenS) const {
  out.count  = table_.count();
  out.chosen = chosen;
  for (uint8_t i = 0; i < out.count; ++i) {
    const LaneState& l = table_.at(i);
    LaneReportEntry& e = out.lanes[i];
    memcpy(e.id, l.id, SCHED_LANE_ID_LEN);
    e.phase        = l.phase;
    e.wait         = l.wait;
    e.hasGreenTime = ((int8_t) i == chosen);
    e.greenTimeS   = e.hasGreenTime ? greenS : 0.0f;
  }
}

SchedulerStatus LaneScheduler::inspect() const {
  SchedulerStatus s;
  s.lanes         = table_.data();
  s.count         = table_.count();
  s.green         = green_;
  s.lastEmergency = lastEmergency_;
  s.greenStartMs  = greenStartMs_;
  s.greenMs       = greenMs_;
  s.yellowS       = cfg_.yellowS;
  return s;
}

void LaneScheduler::logCycle_(int8_t chosen, float greenS, const char* reason) const {
#if SCHED_LOG_LEVEL >= 1
  char   waits[SCHED_MAX_LANES * 7 + 4];
  size_t w = 0;
  waits[0] = '\0';
  for (uint8_t i = 0; i < table_.count() && w < sizeof(waits); ++i) {
    const int L =
        snprintf(waits + w, sizeof(waits) - w, "%s%u", i ? "," : "", (unsigned) table_.at(i).wait);
    if (L < 0)
      break;
    w += (size_t) L;
  }
  SCHED_LOGI("cycle %lu: green=%s (%s) green_time=%.1fs waits=[%s]\n",
             (unsigned long) cycles_,
             table_.at((uint8_t) chosen).id,
             reason,
             (double) greenS,
             waits);
#else
  (void) chosen;
  (void) greenS;
  (void) reason;
#endif
}
