/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Detection Aggregator (Labels -> Lane Counts)   *
 **************************************************************/
#pragma once

#include "scheduler/LaneTypes.h"

#ifndef SCHED_MAX_DETECTIONS
  #define SCHED_MAX_DETECTIONS 32
#endif

/* ONE DETECTED VEHICLE */
struct Detection {
  char         lane[SCHED_LANE_ID_LEN];  /* EMPTY = UNASSIGNED (SKIPPED) */
  char         label[SCHED_LABEL_LEN];   /* EMPTY = NOT CLASSIFIED BY THE SENDER */
  const float* embedding    = nullptr;   /* OPTIONAL FEATURE VECTOR FOR THE CLASSIFIER */
  uint16_t     embeddingLen = 0;
};

/**
 * CLASSIFIER HOOK
 *
 * @param embedding  FEATURE VECTOR
 * @param len        VECTOR LENGTH
 * @param outLabel   LABEL BUFFER (NUL-TERMINATED ON SUCCESS)
 * @param outSz      BUFFER SIZE
 * @param ctx        OPAQUE POINTER GIVEN TO setClassifier()
 * @return           false ON ANY FAILURE (THE DETECTION THEN COUNTS AS NORMAL)
 */
typedef bool (*ClassifyFn)(const float* embedding,
                           uint16_t     len,
                           char*        outLabel,
                           size_t       outSz,
                           void*        ctx);

/*
 * TURNS PER-DETECTION LABELS INTO PER-LANE (normal, emergency) READINGS.
 *
 * LABEL SOURCE: SENDER LABEL, ELSE CLASSIFIER ON THE EMBEDDING.
 * ANY FAILURE DEGRADES THE DETECTION TO 'normal'; A VEHICLE IS NEVER DROPPED
 * FOR A CLASSIFICATION PROBLEM AND THE AGGREGATION NEVER FAILS AS A WHOLE.
 */
class DetectionAggregator {
public:
  DetectionAggregator() = default;

  void setClassifier(ClassifyFn fn, void* ctx);

  bool hasClassifier() const {
    return fn_ != nullptr;
  }

  /* CASE-INSENSITIVE: ambulance / emergency / police / fire */
  static bool isEmergencyLabel(const char* label);

  /**
   * AGGREGATE DETECTIONS
   *
   * @param d       DETECTIONS
   * @param n       NUMBER OF DETECTIONS
   * @param out     READINGS, ONE PER LANE IN FIRST-SEEN ORDER
   * @param maxOut  CAPACITY OF 'out'
   * @return        NUMBER OF LANES WRITTEN
   */
  uint8_t aggregate(const Detection* d, uint16_t n, LaneReading* out, uint8_t maxOut);

  /* STATS OF THE LAST aggregate() CALL */
  uint16_t degraded() const {
    return degraded_;
  }
  uint16_t skipped() const {
    return skipped_;
  }
  uint16_t dropped() const {
    return dropped_;
  }

private:
  bool resolveLabel_(const Detection& d, char* label, size_t labelSz);

  ClassifyFn fn_  = nullptr;
  void*      ctx_ = nullptr;

  uint16_t degraded_ = 0; /* NO USABLE LABEL -> NORMAL */
  uint16_t skipped_  = 0; /* NO LANE ID */
  uint16_t dropped_  = 0; /* LANE BEYOND CAPACITY */
};
