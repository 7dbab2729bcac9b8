/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Library : Scheduler Frames (CSV + XOR Checksum)          *
 **************************************************************/

#pragma once

#include "scheduler/DetectionAggregator.h"
#include "scheduler/LaneScheduler.h"
#include "scheduler/LaneTypes.h"

/*
 * FRAME: "<TYPE>,<FIELDS>*<CS>\n"  OR  "<TYPE>*<CS>\n"  (ASCII + XOR CHECKSUM)
 *
 * REQUESTS:
 *   U : UPDATE      -> U,<n>,{<id>,<normal>,<emergency>}xN*CS
 *   K : DETECTIONS  -> K,<n>,{<id>,<label>}xN*CS        (EMPTY LABEL = UNCLASSIFIED)
 *   Q : STATUS      -> Q*CS
 *
 * REPLIES:
 *   R : REPORT      -> R,<seq>,<greenId|->,<greenMs>,<n>,{<id>,<R|Y|G>,<wait>}xN*CS
 *   S : STATUS      -> S,<greenId|->,<greenMs>,<n>,{<id>,<normal>,<emergency>,<wait>,<R|Y|G>}xN*CS
 *   E : ERROR       -> E,<code>*CS
 */

#ifndef SCHED_FRAME_MAX
  #define SCHED_FRAME_MAX 240
#endif

enum SchedFrameError : uint8_t {
  SF_OK = 0,
  SF_BAD_FRAME,    /* MALFORMED FIELDS */
  SF_TOO_MANY,     /* MORE LANES/DETECTIONS THAN CAPACITY */
  SF_BAD_LANE_ID,  /* EMPTY OR OVERSIZED LANE ID */
  SF_UNKNOWN_TYPE,
  SF_TOO_LONG      /* REPLY DOES NOT FIT THE REPLY BUFFER */
};

const char* SF_errorName(SchedFrameError e);

/* XOR OF ALL BYTES */
uint8_t SF_xor(const uint8_t* data, size_t len);

/**
 * CHECK FRAMING AND CHECKSUM, SPLIT TYPE AND FIELDS
 *
 * @param lineZ     NUL-TERMINATED LINE (TRAILING CR/LF ALLOWED)
 * @param type      OUT: FRAME TYPE CHARACTER
 * @param fields    OUT: NUL-TERMINATED COPY OF THE FIELDS (MAY BE EMPTY)
 * @param fieldsSz  SIZE OF 'fields'
 * @return          false ON MISSING '*', CHECKSUM NOT EXACTLY TWO HEX DIGITS,
 *                  BAD CHECKSUM OR OVERSIZE
 */
bool SF_open(const char* lineZ, char& type, char* fields, size_t fieldsSz);

/**
 * APPEND "*<CS>\n" TO A PAYLOAD
 *
 * @return FRAME LENGTH, 0 IF IT DOES NOT FIT
 */
size_t SF_seal(const char* payload, size_t len, char* out, size_t outSz);

/* ---------- FIELD PARSERS (ADVANCE 'p' PAST THE TRAILING COMMA) ---------- */
bool SF_parseCount(const char*& p, uint16_t& out, bool* clamped = nullptr);
bool SF_parseToken(const char*& p, char* out, size_t outSz, bool* truncated = nullptr);

/* ---------- REQUEST DECODERS ---------- */
SchedFrameError SF_decodeReadings(const char* fields, LaneReading* out, uint8_t maxOut, uint8_t& n);
SchedFrameError SF_decodeDetections(const char* fields,
                                    Detection*  out,
                                    uint16_t    maxOut,
                                    uint16_t&   n);

/* ---------- REPLY ENCODERS (RETURN SEALED FRAME LENGTH, 0 ON OVERFLOW) ---------- */
size_t SF_encodeReport(const LaneReport& r, uint32_t seq, char* out, size_t outSz);
size_t SF_encodeStatus(const SchedulerStatus& s, char* out, size_t outSz);
size_t SF_encodeError(SchedFrameError e, char* out, size_t outSz);

/* ---------- REQUEST ENCODERS (FOR FEEDERS AND TESTS) ---------- */
size_t SF_encodeUpdate(const LaneReading* r, uint8_t n, char* out, size_t outSz);
size_t SF_encodeQuery(char* out, size_t outSz);

