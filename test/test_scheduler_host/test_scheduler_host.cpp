/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   File    : Scheduler Host (Unit Test)                     *
 **************************************************************/

// =============================
//  TEST BUILD CONFIGURATION
// =============================
#ifndef SCHED_LOG_LEVEL
  #define SCHED_LOG_LEVEL 0
#endif

// =============================
//  STANDARD INCLUDES
// =============================
#include <cstdint>
#include <cstdio>
#include <cstring>

// =============================
//  UNITY FRAMEWORK
// =============================
#include <unity.h>

#include "scheduler/SchedulerHost.h"

/* =========================
 *  HELPERS
 * ========================= */
static uint32_t g_now_ms = 0;
static char     g_reply[SCHED_FRAME_MAX];
static char     g_expect[SCHED_FRAME_MAX];

static void fast_forward_past_green() {
  g_now_ms += 20000;
}

static LaneReading rd(const char* id, uint16_t normal, uint16_t emergency) {
  LaneReading r;
  std::memset(&r, 0, sizeof(r));
  std::strncpy(r.id, id, sizeof(r.id) - 1);
  r.normal    = normal;
  r.emergency = emergency;
  return r;
}

static Detection det(const char* lane, const char* label) {
  Detection d;
  std::memset(d.lane, 0, sizeof(d.lane));
  std::memset(d.label, 0, sizeof(d.label));
  std::strncpy(d.lane, lane, sizeof(d.lane) - 1);
  std::strncpy(d.label, label, sizeof(d.label) - 1);
  return d;
}

static const char* frame(const char* payload) {
  TEST_ASSERT_TRUE(SF_seal(payload, std::strlen(payload), g_expect, sizeof(g_expect)) > 0);
  return g_expect;
}

static uint8_t one_arrival(void* ctx) {
  (void) ctx;
  return 1;
}

void setUp() {
  g_now_ms = 0;
  std::memset(g_reply, 0, sizeof(g_reply));
  std::memset(g_expect, 0, sizeof(g_expect));
}

void tearDown() {}

/* =========================
 *  LANE-SET LIFECYCLE
 * ========================= */

/**
 * @brief FIRST UPDATE CREATES THE CORE (NOT COUNTED AS A RESET)
 */
void test_first_update_instantiates() {
  SchedulerHost h;
  TEST_ASSERT_FALSE(h.live());

  LaneReading in[2] = {rd("A", 1, 0), rd("B", 0, 0)};
  LaneReport  out;
  TEST_ASSERT_EQUAL_INT8(0, h.update(in, 2, g_now_ms, out));
  TEST_ASSERT_TRUE(h.live());
  TEST_ASSERT_EQUAL_UINT32(0, h.resets());
  TEST_ASSERT_EQUAL_UINT8(2, h.scheduler().lanes().count());
}

/**
 * @brief SAME SET IN ANOTHER ORDER KEEPS STATE AND REGISTRATION ORDER
 */
void test_same_set_reordered_keeps_state() {
  SchedulerHost h;
  LaneReport    out;

  LaneReading ab[2] = {rd("A", 9, 0), rd("B", 0, 0)};
  h.update(ab, 2, g_now_ms, out);
  fast_forward_past_green();

  LaneReading ba[2] = {rd("B", 0, 0), rd("A", 9, 0)};
  TEST_ASSERT_EQUAL_INT8(0, h.update(ba, 2, g_now_ms, out));
  TEST_ASSERT_EQUAL_UINT32(0, h.resets());
  TEST_ASSERT_EQUAL_STRING("A", h.scheduler().lanes().at(0).id);
  TEST_ASSERT_EQUAL_UINT16(2, h.scheduler().lanes().at(1).wait);
}

/**
 * @brief LANE SET CHANGE [A,B] -> [A,B,C]: EVERYTHING STARTS OVER
 */
void test_lane_set_change_resets() {
  SchedulerHost h;
  LaneReport    out;

  LaneReading ab[2] = {rd("A", 0, 1), rd("B", 0, 0)};
  h.update(ab, 2, g_now_ms, out);
  g_now_ms += 1000;
  h.update(ab, 2, g_now_ms, out);
  TEST_ASSERT_EQUAL_UINT16(2, h.scheduler().lanes().at(1).wait);
  TEST_ASSERT_EQUAL_INT8(0, h.scheduler().inspect().lastEmergency);

  /* THE OLD GREEN IS STILL UNEXPIRED: A RESET MUST NOT HOLD IT */
  g_now_ms += 500;
  LaneReading abc[3] = {rd("A", 0, 0), rd("B", 4, 0), rd("C", 0, 0)};
  TEST_ASSERT_EQUAL_INT8(1, h.update(abc, 3, g_now_ms, out));
  TEST_ASSERT_EQUAL_UINT32(1, h.resets());

  const SchedulerStatus s = h.scheduler().inspect();
  TEST_ASSERT_EQUAL_UINT8(3, s.count);
  TEST_ASSERT_EQUAL_INT8(-1, s.lastEmergency);
  TEST_ASSERT_EQUAL_UINT32(g_now_ms, s.greenStartMs);
  TEST_ASSERT_EQUAL_UINT16(1, s.lanes[0].wait);
  TEST_ASSERT_EQUAL_UINT16(0, s.lanes[1].wait);
  TEST_ASSERT_EQUAL_UINT16(1, s.lanes[2].wait);
  TEST_ASSERT_EQUAL(LP_RED, s.lanes[0].phase);
  TEST_ASSERT_EQUAL(LP_GREEN, s.lanes[1].phase);
  TEST_ASSERT_EQUAL(LP_RED, s.lanes[2].phase);
}

/**
 * @brief DUPLICATE IDS REGISTER ONCE, AT THEIR FIRST POSITION
 */
void test_duplicates_register_first_occurrence() {
  SchedulerHost h;
  LaneReport    out;
  LaneReading   in[3] = {rd("B", 0, 0), rd("A", 0, 0), rd("B", 3, 0)};

  h.update(in, 3, g_now_ms, out);
  TEST_ASSERT_EQUAL_UINT8(2, h.scheduler().lanes().count());
  TEST_ASSERT_EQUAL_STRING("B", h.scheduler().lanes().at(0).id);
  TEST_ASSERT_EQUAL_STRING("A", h.scheduler().lanes().at(1).id);
  TEST_ASSERT_EQUAL_INT8(0, out.chosen); /* LAST B READING (3) WINS */
}

/**
 * @brief ARRIVAL HOOK IS RE-APPLIED TO THE NEW CORE
 */
void test_arrival_hook_survives_reset() {
  SchedulerHost h;
  h.setArrivalSource(one_arrival, nullptr);
  LaneReport out;

  LaneReading ab[2] = {rd("A", 3, 0), rd("B", 0, 0)};
  h.update(ab, 2, g_now_ms, out);
  TEST_ASSERT_EQUAL_UINT16(1, h.scheduler().lanes().at(1).normal);

  fast_forward_past_green();
  LaneReading abc[3] = {rd("A", 3, 0), rd("B", 0, 0), rd("C", 0, 0)};
  h.update(abc, 3, g_now_ms, out);
  TEST_ASSERT_EQUAL_UINT16(1, h.scheduler().lanes().at(1).normal);
  TEST_ASSERT_EQUAL_UINT16(1, h.scheduler().lanes().at(2).normal);
}

/* =========================
 *  DETECTIONS / STANDALONE
 * ========================= */

/**
 * @brief LABELED DETECTIONS -> COUNTS -> DECISION
 */
void test_predict_and_update() {
  SchedulerHost h;
  LaneReport    out;
  Detection     d[4] = {det("A", "car"), det("B", "bus"), det("B", "truck"), det("A", "Ambulance")};

  TEST_ASSERT_EQUAL_INT8(0, h.predictAndUpdate(d, 4, g_now_ms, out));
  TEST_ASSERT_EQUAL_UINT16(1, h.scheduler().lanes().at(0).emergency);
  TEST_ASSERT_EQUAL_UINT16(0, h.aggregator().degraded());
}

/**
 * @brief DEFAULT LANES, FEEDLESS CYCLES
 */
void test_standalone_steps() {
  SchedulerHost h;
  LaneReport    out;
  TEST_ASSERT_EQUAL_INT8(-1, h.simulateStep(g_now_ms, out));
  TEST_ASSERT_EQUAL_UINT8(0, out.count);

  TEST_ASSERT_EQUAL_UINT8(4, h.beginStandalone(4));
  TEST_ASSERT_EQUAL_STRING("Lane_4", h.scheduler().lanes().at(3).id);

  for (int k = 0; k < 12; ++k) {
    TEST_ASSERT_TRUE(h.simulateStep(g_now_ms, out) >= 0);
    fast_forward_past_green();
  }
  TEST_ASSERT_EQUAL_UINT32(12, h.scheduler().cycles());
  TEST_ASSERT_EQUAL_UINT8(4, out.count);
  TEST_ASSERT_EQUAL_UINT32(0, h.resets());
}

/* =========================
 *  FRAMES
 * ========================= */

/**
 * @brief U -> R WITH THE FULL REPORT
 */
void test_line_update_reports() {
  SchedulerHost h;
  const size_t  L = h.handleLine("U,2,A,0,0,B,2,0*4A\n", g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_TRUE(L > 0);
  TEST_ASSERT_EQUAL_STRING("R,1,B,3000,2,A,R,1,B,G,0*07\n", g_reply);
  TEST_ASSERT_EQUAL_UINT32(1, h.seq());
}

/**
 * @brief Q BEFORE ANY LANE SET -> EMPTY STATUS; AFTER -> TABLE
 */
void test_line_query() {
  SchedulerHost h;
  h.handleLine("Q*51\n", g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING("S,-,0,0*52\n", g_reply);

  /* NEGATIVE COUNT IS CLAMPED TO 0 */
  h.handleLine(frame("U,1,A,-4,0"), g_now_ms, g_reply, sizeof(g_reply));
  h.handleLine("Q*51\n", g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING(frame("S,A,3000,1,A,0,0,0,G"), g_reply);
}

/**
 * @brief K -> AGGREGATE -> R
 */
void test_line_detections() {
  SchedulerHost h;
  h.handleLine(frame("K,3,A,car,B,police,B,"), g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL(0, std::strncmp(g_reply, "R,1,B,", 6));
  TEST_ASSERT_EQUAL_UINT16(1, h.aggregator().degraded());
}

/**
 * @brief U,0 -> EMPTY REPORT, NOT AN ERROR
 */
void test_line_empty_lane_set() {
  SchedulerHost h;
  h.handleLine(frame("U,0"), g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING(frame("R,1,-,0,0"), g_reply);
}

/**
 * @brief BAD CHECKSUM -> SILENCE; BROKEN FRAMES -> E
 */
void test_line_errors() {
  SchedulerHost h;
  TEST_ASSERT_EQUAL_size_t(0, h.handleLine("U,2,A,0,0,B,2,0*00\n", g_now_ms, g_reply, sizeof(g_reply)));
  TEST_ASSERT_EQUAL_size_t(0, h.handleLine("garbage", g_now_ms, g_reply, sizeof(g_reply)));
  TEST_ASSERT_EQUAL_size_t(0, h.handleLine(nullptr, g_now_ms, g_reply, sizeof(g_reply)));

  h.handleLine(frame("X,1"), g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING(frame("E,UNKNOWN_TYPE"), g_reply);

  h.handleLine(frame("U,9,A,0,0,B,0,0,C,0,0,D,0,0,E,0,0,F,0,0,G,0,0,H,0,0,I,0,0"),
               g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING(frame("E,TOO_MANY"), g_reply);

  h.handleLine(frame("U,1,A,x,0"), g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_EQUAL_STRING(frame("E,BAD_FRAME"), g_reply);

  TEST_ASSERT_FALSE(h.live()); /* NO ERROR TOUCHED THE CORE */
  TEST_ASSERT_EQUAL_UINT32(0, h.seq());
}

/**
 * @brief FULL TABLE OF LONG IDS: Q AND U STILL GET A REPLY WHEN IT CANNOT FIT
 */
void test_line_reply_too_long() {
  SchedulerHost h;
  LaneReading   in[SCHED_MAX_LANES];
  char          id[SCHED_LANE_ID_LEN];
  for (uint8_t i = 0; i < SCHED_MAX_LANES; ++i) {
    std::snprintf(id, sizeof(id), "lane_id_%07u", (unsigned) (i + 1));
    TEST_ASSERT_EQUAL_size_t(SCHED_LANE_ID_LEN - 1, std::strlen(id));
    in[i] = rd(id, 60000, 60000);
  }
  LaneReport out;
  h.update(in, SCHED_MAX_LANES, g_now_ms, out);
  TEST_ASSERT_EQUAL_UINT8(SCHED_MAX_LANES, h.scheduler().lanes().count());

  const size_t L = h.handleLine("Q*51\n", g_now_ms, g_reply, sizeof(g_reply));
  TEST_ASSERT_TRUE(L > 0);
  TEST_ASSERT_EQUAL_STRING(frame("E,TOO_LONG"), g_reply);

  /* R THAT DOES NOT FIT A SMALL REPLY BUFFER */
  SchedulerHost small;
  TEST_ASSERT_TRUE(small.handleLine("U,2,A,0,0,B,2,0*4A\n", g_now_ms, g_reply, 24) > 0);
  TEST_ASSERT_EQUAL_STRING(frame("E,TOO_LONG"), g_reply);
  TEST_ASSERT_TRUE(small.live()); /* THE CYCLE STILL RAN */
}

/* =========================
 *  UNITY TEST RUNNER (MAIN)
 * ========================= */
int main() {
  UNITY_BEGIN();
  RUN_TEST(test_first_update_instantiates);
  RUN_TEST(test_same_set_reordered_keeps_state);
  RUN_TEST(test_lane_set_change_resets);
  RUN_TEST(test_duplicates_register_first_occurrence);
  RUN_TEST(test_arrival_hook_survives_reset);
  RUN_TEST(test_predict_and_update);
  RUN_TEST(test_standalone_steps);
  RUN_TEST(test_line_update_reports);
  RUN_TEST(test_line_query);
  RUN_TEST(test_line_detections);
  RUN_TEST(test_line_empty_lane_set);
  RUN_TEST(test_line_reply_too_long);
  RUN_TEST(test_line_errors);
  return UNITY_END();
}
