/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Detection Aggregator (Labels -> Lane Counts)   *
 **************************************************************/

#include "scheduler/DetectionAggregator.h"

#include <ctype.h>
#include <string.h>

#define LOG_TAG "sched_detect"
#include "scheduler/SchedLog.h"

static const char* const kEmergencyKeywords[] = {"ambulance", "emergency", "police", "fire"};

void DetectionAggregator::setClassifier(ClassifyFn fn, void* ctx) {
  fn_  = fn;
  ctx_ = ctx;
}

bool DetectionAggregator::isEmergencyLabel(const char* label) {
  if (!label || !label[0])
    return false;

  char   low[SCHED_LABEL_LEN];
  size_t i = 0;
  for (; label[i] && i < sizeof(low) - 1; ++i)
    low[i] = (char) tolower((unsigned char) label[i]);
  low[i] = '\0';

  for (size_t k = 0; k < sizeof(kEmergencyKeywords) / sizeof(kEmergencyKeywords[0]); ++k)
    if (strstr(low, kEmergencyKeywords[k]))
      return true;
  return false;
}

bool DetectionAggregator::resolveLabel_(const Detection& d, char* label, size_t labelSz) {
  /* 1) SENDER LABEL */
  if (d.label[0]) {
    strncpy(label, d.label, labelSz - 1);
    label[labelSz - 1] = '\0';
    return true;
  }

  /* 2) CLASSIFIER ON THE EMBEDDING */
  if (d.embedding && d.embeddingLen > 0) {
    if (!fn_) {
      SCHED_LOGD("detect: no classifier for lane '%s'\n", d.lane);
      return false;
    }
    label[0] = '\0';
    if (!fn_(d.embedding, d.embeddingLen, label, labelSz, ctx_) || !label[0]) {
      SCHED_LOGD("detect: classifier failed for lane '%s'\n", d.lane);
      return false;
    }
    label[labelSz - 1] = '\0';
    return true;
  }

  /* 3) NOTHING TO CLASSIFY */
  return false;
}

uint8_t DetectionAggregator::aggregate(const Detection* d,
                                       uint16_t         n,
                                       LaneReading*     out,
                                       uint8_t          maxOut) {
  degraded_ = 0;
  skipped_  = 0;
  dropped_  = 0;

  uint8_t lanes = 0;
  for (uint16_t k = 0; k < n; ++k) {
    const Detection& det = d[k];
    if (!det.lane[0]) {
      skipped_++;
      continue;
    }

    /* FIRST-SEEN LANE ORDER */
    int16_t slot = -1;
    for (uint8_t i = 0; i < lanes; ++i)
      if (strncmp(out[i].id, det.lane, SCHED_LANE_ID_LEN) == 0) {
        slot = i;
        break;
      }
    if (slot < 0) {
      if (lanes >= maxOut || !laneIdCopy(out[lanes].id, det.lane)) {
        dropped_++;
        continue;
      }
      out[lanes].normal    = 0;
      out[lanes].emergency = 0;
      slot                 = lanes++;
    }

    char label[SCHED_LABEL_LEN];
    bool isEmergency = false;
    if (resolveLabel_(det, label, sizeof(label)))
      isEmergency = isEmergencyLabel(label);
    else
      degraded_++;

    uint16_t& c = isEmergency ? out[slot].emergency : out[slot].normal;
    if (c < SCHED_COUNT_MAX)
      c++;
  }

  if (dropped_)
    SCHED_LOGW("detect: %u detections dropped (more than %u lanes)\n",
               (unsigned) dropped_,
               (unsigned) maxOut);
  if (degraded_)
    SCHED_LOGI("detect: %u/%u detections unclassified -> normal\n",
               (unsigned) degraded_,
               (unsigned) n);
  return lanes;
}
