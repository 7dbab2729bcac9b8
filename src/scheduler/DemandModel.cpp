/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Demand Evolution Model                         *
 **************************************************************/

#include "scheduler/DemandModel.h"

#define LOG_TAG "sched_demand"
#include "scheduler/SchedLog.h"

DemandModel::DemandModel(uint32_t seed) {
  this->seed(seed);
}

void DemandModel::seed(uint32_t s) {
  state_ = (s != 0) ? s : (uint32_t) SCHED_DEMAND_SEED;
}

void DemandModel::setArrivalSource(ArrivalFn fn, void* ctx) {
  fn_  = fn;
  ctx_ = ctx;
}

uint8_t DemandModel::nextArrivals() {
  if (fn_) {
    const uint8_t v = fn_(ctx_);
    return (v > SCHED_MAX_ARRIVALS) ? (uint8_t) SCHED_MAX_ARRIVALS : v;
  }

  /* XORSHIFT32 */
  uint32_t s = state_;
  s ^= s << 13;
  s ^= s >> 17;
  s ^= s << 5;
  state_ = s;
  return (uint8_t) (s % (SCHED_MAX_ARRIVALS + 1));
}

uint16_t DemandModel::cleared(uint16_t normal, float greenS, float clearanceRate) {
  const float capacity = clearanceRate * greenS;
  if (capacity <= 0.0f)
    return 0;
  /* floor() OF A NON-NEGATIVE VALUE, SATURATED TO THE COUNT RANGE */
  const uint32_t cap = (capacity >= (float) SCHED_COUNT_MAX) ? SCHED_COUNT_MAX : (uint32_t) capacity;
  return (normal < cap) ? normal : (uint16_t) cap;
}

void DemandModel::evolve(LaneState* lanes,
                         uint8_t    count,
                         int8_t     chosen,
                         float      greenS,
                         float      clearanceRate) {
  for (uint8_t i = 0; i < count; ++i) {
    if ((int8_t) i == chosen) {
      const uint16_t out = cleared(lanes[i].normal, greenS, clearanceRate);
      lanes[i].normal    = (uint16_t) (lanes[i].normal - out);
      SCHED_LOGD("demand: %s cleared=%u left=%u\n", lanes[i].id, (unsigned) out,
                 (unsigned) lanes[i].normal);
    } else {
      const uint32_t grown = (uint32_t) lanes[i].normal + nextArrivals();
      lanes[i].normal      = (grown > SCHED_COUNT_MAX) ? (uint16_t) SCHED_COUNT_MAX : (uint16_t) grown;
    }
  }
}
