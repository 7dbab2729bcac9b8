/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Library : Lane Selectors & Green-Time Estimator          *
 **************************************************************/

#include "scheduler/LaneSelectors.h"

/* =================================[ EMERGENCY ]================================= */
int8_t SEL_emergencyLane(const LaneState* lanes, uint8_t count, int8_t& lastEmergency) {
  uint16_t maxCount = 0;
  for (uint8_t i = 0; i < count; ++i)
    if (lanes[i].emergency > maxCount)
      maxCount = lanes[i].emergency;

  if (maxCount == 0)
    return -1;

  /* ROUND-ROBIN: FIRST TIED LANE AFTER THE LAST EMERGENCY GRANT */
  const uint8_t start =
      (lastEmergency >= 0 && lastEmergency < (int8_t) count) ? (uint8_t) ((lastEmergency + 1) % count)
                                                              : 0;
  for (uint8_t k = 0; k < count; ++k) {
    const uint8_t i = (uint8_t) ((start + k) % count);
    if (lanes[i].emergency == maxCount) {
      lastEmergency = (int8_t) i;
      return (int8_t) i;
    }
  }
  return -1; /* UNREACHABLE: maxCount CAME FROM SOME LANE */
}

/* =================================[ FAIRNESS ]================================== */
float SEL_fairScore(const LaneState& lane, const SchedulerConfig& cfg) {
  float score = (float) lane.normal * (1.0f + (float) lane.wait * cfg.waitBoost);
  if (lane.wait >= cfg.starvationLimit)
    score += SCHED_STARVATION_BONUS;
  return score;
}

int8_t SEL_fairLane(const LaneState* lanes, uint8_t count, const SchedulerConfig& cfg) {
  if (count == 0)
    return -1;

  int8_t best      = 0;
  float  bestScore = SEL_fairScore(lanes[0], cfg);
  for (uint8_t i = 1; i < count; ++i) {
    const float s = SEL_fairScore(lanes[i], cfg);
    if (s > bestScore) { /* STRICT: EARLIER LANE KEEPS A TIE */
      best      = (int8_t) i;
      bestScore = s;
    }
  }
  return best;
}

/* ================================[ GREEN TIME ]================================= */
float SEL_greenTimeS(const LaneState& lane, const SchedulerConfig& cfg) {
  const float clear          = (float) lane.normal / cfg.clearanceRate;
  const float waitBonus      = (float) lane.wait * SCHED_GREEN_WAIT_BONUS_S;
  const float emergencyBonus = (float) lane.emergency * SCHED_GREEN_EMERGENCY_BONUS_S;

  const float raw = clear + waitBonus + emergencyBonus;
  if (raw < cfg.minGreenS)
    return cfg.minGreenS;
  if (raw > cfg.maxGreenS)
    return cfg.maxGreenS;
  return raw;
}
