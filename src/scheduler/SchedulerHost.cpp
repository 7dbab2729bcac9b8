/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Scheduler Host (Lane-Set Owner + Dispatcher)   *
 **************************************************************/

#include "scheduler/SchedulerHost.h"

#define LOG_TAG "sched_host"
#include "scheduler/SchedLog.h"

SchedulerHost::SchedulerHost(const SchedulerConfig& cfg) : cfg_(cfg), core_(cfg) {}

/* ================================== LIFECYCLE ==================================== */
void SchedulerHost::applyDemandHooks_() {
  core_.demand().seed(seed_);
  core_.demand().setArrivalSource(arrivalFn_, arrivalCtx_);
}

void SchedulerHost::instantiate_(const LaneReading* readings, uint8_t n) {
  core_ = LaneScheduler(cfg_);
  applyDemandHooks_();

  for (uint8_t k = 0; k < n; ++k) {
    if (core_.lanes().indexOf(readings[k].id) >= 0)
      continue; /* DUPLICATE: FIRST OCCURRENCE KEEPS ITS SLOT */
    core_.registerLane(readings[k].id);
  }

  if (live_)
    resets_++;
  live_ = true;
  SCHED_LOGI("host: lane set (re)registered, %u lanes, resets=%lu\n",
             (unsigned) core_.lanes().count(),
             (unsigned long) resets_);
}

void SchedulerHost::setArrivalSource(ArrivalFn fn, void* ctx) {
  arrivalFn_  = fn;
  arrivalCtx_ = ctx;
  core_.demand().setArrivalSource(fn, ctx);
}

void SchedulerHost::seedDemand(uint32_t seed) {
  seed_ = seed;
  core_.demand().seed(seed);
}

/* ==================================== CYCLES ===================================== */
int8_t SchedulerHost::update(const LaneReading* readings,
                             uint8_t            n,
                             uint32_t           nowMs,
                             LaneReport&        out) {
  if (!live_ || !core_.lanes().sameSet(readings, n))
    instantiate_(readings, n);
  return core_.decide(readings, n, nowMs, out);
}

int8_t SchedulerHost::predictAndUpdate(const Detection* d,
                                       uint16_t         n,
                                       uint32_t         nowMs,
                                       LaneReport&      out) {
  const uint8_t lanes = agg_.aggregate(d, n, readBuf_, SCHED_MAX_LANES);
  return update(readBuf_, lanes, nowMs, out);
}

uint8_t SchedulerHost::beginStandalone(uint8_t n) {
  core_ = LaneScheduler(cfg_);
  applyDemandHooks_();
  if (live_)
    resets_++;
  live_ = true;

  const uint8_t added = core_.registerDefaultLanes(n);
  SCHED_LOGI("host: standalone with %u default lanes\n", (unsigned) added);
  return added;
}

int8_t SchedulerHost::simulateStep(uint32_t nowMs, LaneReport& out) {
  if (!live_) {
    out.count  = 0;
    out.chosen = -1;
    return -1;
  }
  return core_.decideRetained(nowMs, out);
}

/* =================================== FRAMES ====================================== */
size_t SchedulerHost::encodeReport(const LaneReport& r, char* out, size_t outSz) {
  return SF_encodeReport(r, ++seq_, out, outSz);
}

/* A VALID REQUEST ALWAYS GETS A REPLY: FALL BACK TO E,TOO_LONG WHEN IT DOES NOT FIT */
size_t SchedulerHost::replyOrTooLong_(size_t len, char type, char* reply, size_t replySz) const {
  if (len > 0)
    return len;
  SCHED_LOGW("host: '%c' reply exceeds %u bytes\n", type, (unsigned) replySz);
  return SF_encodeError(SF_TOO_LONG, reply, replySz);
}

size_t SchedulerHost::handleLine(const char* lineZ, uint32_t nowMs, char* reply, size_t replySz) {
  char type = 0;
  char fields[SCHED_FRAME_MAX];
  if (!lineZ || !SF_open(lineZ, type, fields, sizeof(fields))) {
    SCHED_LOGD("host: frame dropped (framing/checksum)\n");
    return 0;
  }

  SchedFrameError err = SF_OK;
  switch (type) {
    case 'U': {
      uint8_t n = 0;
      err       = SF_decodeReadings(fields, readBuf_, SCHED_MAX_LANES, n);
      if (err != SF_OK)
        break;
      update(readBuf_, n, nowMs, report_);
      return replyOrTooLong_(encodeReport(report_, reply, replySz), type, reply, replySz);
    }
    case 'K': {
      uint16_t n = 0;
      err        = SF_decodeDetections(fields, detBuf_, SCHED_MAX_DETECTIONS, n);
      if (err != SF_OK)
        break;
      predictAndUpdate(detBuf_, n, nowMs, report_);
      return replyOrTooLong_(encodeReport(report_, reply, replySz), type, reply, replySz);
    }
    case 'Q': {
      const SchedulerStatus s = live_ ? core_.inspect() : SchedulerStatus();
      return replyOrTooLong_(SF_encodeStatus(s, reply, replySz), type, reply, replySz);
    }
    default:
      err = SF_UNKNOWN_TYPE;
      break;
  }

  SCHED_LOGW("host: '%c' frame rejected: %s\n", type, SF_errorName(err));
  return SF_encodeError(err, reply, replySz);
}
