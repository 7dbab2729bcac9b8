/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Library : Scheduler Frames (CSV + XOR Checksum)          *
 **************************************************************/

#include "scheduler/SchedFrame.h"

#include <ctype.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define LOG_TAG "sched_frame"
#include "scheduler/SchedLog.h"

const char* SF_errorName(SchedFrameError e) {
  switch (e) {
    case SF_OK:
      return "OK";
    case SF_BAD_FRAME:
      return "BAD_FRAME";
    case SF_TOO_MANY:
      return "TOO_MANY";
    case SF_BAD_LANE_ID:
      return "BAD_LANE_ID";
    case SF_TOO_LONG:
      return "TOO_LONG";
    default:
      return "UNKNOWN_TYPE";
  }
}

/* ===================================[ FRAMING ]======================================== */
uint8_t SF_xor(const uint8_t* data, size_t len) {
  uint8_t cs = 0;
  while (len--)
    cs ^= *data++;
  return cs;
}

bool SF_open(const char* lineZ, char& type, char* fields, size_t fieldsSz) {
  const char* star = strchr(lineZ, '*');
  if (!star || star == lineZ)
    return false;

  /* EXACTLY TWO HEX DIGITS, THEN ONLY CR/LF */
  if (!isxdigit((unsigned char) star[1]) || !isxdigit((unsigned char) star[2]))
    return false;
  for (const char* t = star + 3; *t; ++t)
    if (*t != '\r' && *t != '\n')
      return false;

  const char    hex[3] = {star[1], star[2], '\0'};
  const uint8_t csRx   = (uint8_t) strtoul(hex, nullptr, 16);

  const size_t payLen = (size_t) (star - lineZ);
  if (SF_xor(reinterpret_cast<const uint8_t*>(lineZ), payLen) != csRx)
    return false;

  type = lineZ[0];
  if (payLen == 1) {
    fields[0] = '\0';
    return true;
  }
  if (lineZ[1] != ',')
    return false;

  const size_t fLen = payLen - 2;
  if (fLen >= fieldsSz)
    return false;
  memcpy(fields, lineZ + 2, fLen);
  fields[fLen] = '\0';
  return true;
}

size_t SF_seal(const char* payload, size_t len, char* out, size_t outSz) {
  const uint8_t cs = SF_xor(reinterpret_cast<const uint8_t*>(payload), len);
  const int     F  = snprintf(out, outSz, "%.*s*%02X\n", (int) len, payload, cs);
  if (F <= 0 || (size_t) F >= outSz)
    return 0;
  return (size_t) F;
}

/* ===================================[ CSV UTILS ]====================================== */
bool SF_parseCount(const char*& p, uint16_t& out, bool* clamped) {
  char* end = nullptr;
  long  v   = strtol(p, &end, 10);
  if (end == p)
    return false;
  if (*end != ',' && *end != '\0')
    return false;

  bool c = false;
  if (v < 0) {
    v = 0;
    c = true;
  } else if (v > (long) SCHED_COUNT_MAX) {
    v = (long) SCHED_COUNT_MAX;
    c = true;
  }
  if (clamped)
    *clamped = c;

  out = (uint16_t) v;
  p   = (*end == ',') ? end + 1 : end;
  return true;
}

bool SF_parseToken(const char*& p, char* out, size_t outSz, bool* truncated) {
  if (!out || outSz == 0)
    return false;

  size_t i = 0;
  bool   t = false;
  while (*p && *p != ',') {
    if (i < outSz - 1)
      out[i++] = *p;
    else
      t = true;
    ++p;
  }
  out[i] = '\0';
  if (*p == ',')
    ++p;
  if (truncated)
    *truncated = t;
  return true;
}

/* ===================================[ DECODERS ]======================================= */
SchedFrameError SF_decodeReadings(const char* fields, LaneReading* out, uint8_t maxOut, uint8_t& n) {
  const char* p   = fields;
  uint16_t    cnt = 0;
  if (!SF_parseCount(p, cnt))
    return SF_BAD_FRAME;
  if (cnt > maxOut)
    return SF_TOO_MANY;

  for (uint16_t k = 0; k < cnt; ++k) {
    LaneReading& r     = out[k];
    bool         trunc = false;
    if (!*p)
      return SF_BAD_FRAME; /* FEWER LANES THAN ANNOUNCED */
    SF_parseToken(p, r.id, sizeof(r.id), &trunc);
    if (trunc || !r.id[0])
      return SF_BAD_LANE_ID;

    bool clampN = false, clampE = false;
    if (!SF_parseCount(p, r.normal, &clampN))
      return SF_BAD_FRAME;
    if (!SF_parseCount(p, r.emergency, &clampE))
      return SF_BAD_FRAME;
    if (clampN || clampE)
      SCHED_LOGW("frame: lane '%s' count out of range -> clamped (n=%u e=%u)\n",
                 r.id,
                 (unsigned) r.normal,
                 (unsigned) r.emergency);
  }
  if (*p)
    return SF_BAD_FRAME;

  n = (uint8_t) cnt;
  return SF_OK;
}

SchedFrameError SF_decodeDetections(const char* fields,
                                    Detection*  out,
                                    uint16_t    maxOut,
                                    uint16_t&   n) {
  const char* p   = fields;
  uint16_t    cnt = 0;
  if (!SF_parseCount(p, cnt))
    return SF_BAD_FRAME;
  if (cnt > maxOut)
    return SF_TOO_MANY;

  for (uint16_t k = 0; k < cnt; ++k) {
    Detection& d     = out[k];
    bool       trunc = false;
    if (!*p)
      return SF_BAD_FRAME;
    SF_parseToken(p, d.lane, sizeof(d.lane), &trunc);
    if (trunc)
      return SF_BAD_LANE_ID;
    SF_parseToken(p, d.label, sizeof(d.label), nullptr); /* LONG LABELS ARE CUT */
    d.embedding    = nullptr;
    d.embeddingLen = 0;
  }
  if (*p)
    return SF_BAD_FRAME;

  n = cnt;
  return SF_OK;
}

/* ===================================[ ENCODERS ]======================================= */
static bool sf_append(char* buf, size_t sz, size_t& len, const char* fmt, ...) {
  if (len >= sz)
    return false;
  va_list ap;
  va_start(ap, fmt);
  const int L = vsnprintf(buf + len, sz - len, fmt, ap);
  va_end(ap);
  if (L < 0 || (size_t) L >= sz - len)
    return false;
  len += (size_t) L;
  return true;
}

static uint32_t sf_ms(float s) {
  return (s > 0.0f) ? (uint32_t) (s * 1000.0f + 0.5f) : 0;
}

size_t SF_encodeReport(const LaneReport& r, uint32_t seq, char* out, size_t outSz) {
  char   p[SCHED_FRAME_MAX];
  size_t L = 0;

  const bool     has     = (r.chosen >= 0 && r.chosen < (int8_t) r.count);
  const char*    greenId = has ? r.lanes[r.chosen].id : "-";
  const uint32_t greenMs = has ? sf_ms(r.lanes[r.chosen].greenTimeS) : 0;

  if (!sf_append(p, sizeof(p), L, "R,%lu,%s,%lu,%u", (unsigned long) seq, greenId,
                 (unsigned long) greenMs, (unsigned) r.count))
    return 0;
  for (uint8_t i = 0; i < r.count; ++i) {
    const LaneReportEntry& e = r.lanes[i];
    if (!sf_append(p, sizeof(p), L, ",%s,%c,%u", e.id, lanePhaseChar(e.phase), (unsigned) e.wait))
      return 0;
  }
  return SF_seal(p, L, out, outSz);
}

size_t SF_encodeStatus(const SchedulerStatus& s, char* out, size_t outSz) {
  char   p[SCHED_FRAME_MAX];
  size_t L = 0;

  const bool  has     = (s.green >= 0 && s.green < (int8_t) s.count);
  const char* greenId = has ? s.lanes[s.green].id : "-";

  if (!sf_append(p, sizeof(p), L, "S,%s,%lu,%u", greenId,
                 (unsigned long) (has ? s.greenMs : 0), (unsigned) s.count))
    return 0;
  for (uint8_t i = 0; i < s.count; ++i) {
    const LaneState& l = s.lanes[i];
    if (!sf_append(p, sizeof(p), L, ",%s,%u,%u,%u,%c", l.id, (unsigned) l.normal,
                   (unsigned) l.emergency, (unsigned) l.wait, lanePhaseChar(l.phase)))
      return 0;
  }
  return SF_seal(p, L, out, outSz);
}

size_t SF_encodeError(SchedFrameError e, char* out, size_t outSz) {
  char      p[32];
  const int L = snprintf(p, sizeof(p), "E,%s", SF_errorName(e));
  if (L < 0)
    return 0;
  return SF_seal(p, (size_t) L, out, outSz);
}

size_t SF_encodeUpdate(const LaneReading* r, uint8_t n, char* out, size_t outSz) {
  char   p[SCHED_FRAME_MAX];
  size_t L = 0;
  if (!sf_append(p, sizeof(p), L, "U,%u", (unsigned) n))
    return 0;
  for (uint8_t i = 0; i < n; ++i)
    if (!sf_append(p, sizeof(p), L, ",%s,%u,%u", r[i].id, (unsigned) r[i].normal,
                   (unsigned) r[i].emergency))
      return 0;
  return SF_seal(p, L, out, outSz);
}

size_t SF_encodeQuery(char* out, size_t outSz) {
  return SF_seal("Q", 1, out, outSz);
}
