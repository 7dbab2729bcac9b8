/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   File    : Detection Aggregator (Unit Test)               *
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

#include "scheduler/DetectionAggregator.h"

/* =========================
 *  HELPERS / FAKE CLASSIFIER
 * ========================= */
static Detection det(const char* lane, const char* label) {
  Detection d;
  std::memset(d.lane, 0, sizeof(d.lane));
  std::memset(d.label, 0, sizeof(d.label));
  std::strncpy(d.lane, lane, sizeof(d.lane) - 1);
  std::strncpy(d.label, label, sizeof(d.label) - 1);
  return d;
}

/* EMBEDDING[0] > 0.5 -> "Ambulance", < 0 -> FAILURE, ELSE "car" */
static int g_classify_calls = 0;
static bool fake_classifier(const float* e, uint16_t len, char* out, size_t outSz, void* ctx) {
  (void) len;
  (void) ctx;
  g_classify_calls++;
  if (e[0] < 0.0f)
    return false;
  std::snprintf(out, outSz, "%s", (e[0] > 0.5f) ? "Ambulance" : "car");
  return true;
}

static const float kSiren[]  = {0.9f, 0.1f};
static const float kCar[]    = {0.2f, 0.7f};
static const float kBroken[] = {-1.0f, 0.0f};

static DetectionAggregator g_agg;
static LaneReading         g_out[SCHED_MAX_LANES];

void setUp() {
  g_agg            = DetectionAggregator();
  g_classify_calls = 0;
  std::memset(g_out, 0, sizeof(g_out));
}

void tearDown() {}

/* =========================
 *  LABEL MAPPING
 * ========================= */

/**
 * @brief EMERGENCY KEYWORDS, CASE-INSENSITIVE, AS SUBSTRINGS
 */
void test_emergency_keywords() {
  TEST_ASSERT_TRUE(DetectionAggregator::isEmergencyLabel("ambulance"));
  TEST_ASSERT_TRUE(DetectionAggregator::isEmergencyLabel("POLICE"));
  TEST_ASSERT_TRUE(DetectionAggregator::isEmergencyLabel("Fire_Truck"));
  TEST_ASSERT_TRUE(DetectionAggregator::isEmergencyLabel("emergency-van"));
  TEST_ASSERT_FALSE(DetectionAggregator::isEmergencyLabel("car"));
  TEST_ASSERT_FALSE(DetectionAggregator::isEmergencyLabel(""));
  TEST_ASSERT_FALSE(DetectionAggregator::isEmergencyLabel(nullptr));
}

/* =========================
 *  AGGREGATION
 * ========================= */

/**
 * @brief PER-LANE COUNTS IN FIRST-SEEN ORDER
 */
void test_counts_first_seen_order() {
  Detection d[5] = {det("south", "car"), det("north", "truck"), det("south", "Police car"),
                    det("south", "bus"), det("north", "ambulance")};

  TEST_ASSERT_EQUAL_UINT8(2, g_agg.aggregate(d, 5, g_out, SCHED_MAX_LANES));
  TEST_ASSERT_EQUAL_STRING("south", g_out[0].id);
  TEST_ASSERT_EQUAL_UINT16(2, g_out[0].normal);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].emergency);
  TEST_ASSERT_EQUAL_STRING("north", g_out[1].id);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[1].normal);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[1].emergency);
  TEST_ASSERT_EQUAL_UINT16(0, g_agg.degraded());
}

/**
 * @brief SENDER LABEL WINS OVER THE CLASSIFIER
 */
void test_sender_label_preferred() {
  g_agg.setClassifier(fake_classifier, nullptr);
  Detection d[1] = {det("A", "car")};
  d[0].embedding    = kSiren;
  d[0].embeddingLen = 2;

  g_agg.aggregate(d, 1, g_out, SCHED_MAX_LANES);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].normal);
  TEST_ASSERT_EQUAL_INT(0, g_classify_calls);
}

/**
 * @brief UNLABELED DETECTIONS GO THROUGH THE CLASSIFIER
 */
void test_classifier_on_embedding() {
  g_agg.setClassifier(fake_classifier, nullptr);
  TEST_ASSERT_TRUE(g_agg.hasClassifier());
  Detection d[2] = {det("A", ""), det("A", "")};
  d[0].embedding    = kSiren;
  d[0].embeddingLen = 2;
  d[1].embedding    = kCar;
  d[1].embeddingLen = 2;

  g_agg.aggregate(d, 2, g_out, SCHED_MAX_LANES);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].emergency);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].normal);
  TEST_ASSERT_EQUAL_INT(2, g_classify_calls);
}

/**
 * @brief FAILING / ABSENT CLASSIFIER AND MISSING INPUT DEGRADE TO NORMAL
 */
void test_failures_degrade_to_normal() {
  Detection d[3] = {det("A", ""), det("A", ""), det("B", "")};
  d[0].embedding    = kSiren; /* NO CLASSIFIER INSTALLED */
  d[0].embeddingLen = 2;
  d[1].embedding    = kBroken;
  d[1].embeddingLen = 2;

  TEST_ASSERT_EQUAL_UINT8(2, g_agg.aggregate(d, 3, g_out, SCHED_MAX_LANES));
  TEST_ASSERT_EQUAL_UINT16(2, g_out[0].normal);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[1].normal);
  TEST_ASSERT_EQUAL_UINT16(3, g_agg.degraded());

  g_agg.setClassifier(fake_classifier, nullptr);
  g_agg.aggregate(d, 3, g_out, SCHED_MAX_LANES);
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].emergency); /* SIREN NOW CLASSIFIED */
  TEST_ASSERT_EQUAL_UINT16(1, g_out[0].normal);    /* BROKEN -> NORMAL */
  TEST_ASSERT_EQUAL_UINT16(2, g_agg.degraded());
}

/**
 * @brief NO LANE -> SKIPPED; LANES BEYOND CAPACITY -> DROPPED
 */
void test_skip_and_drop() {
  Detection d[4] = {det("", "car"), det("A", "car"), det("B", "car"), det("C", "car")};

  TEST_ASSERT_EQUAL_UINT8(2, g_agg.aggregate(d, 4, g_out, 2));
  TEST_ASSERT_EQUAL_UINT16(1, g_agg.skipped());
  TEST_ASSERT_EQUAL_UINT16(1, g_agg.dropped());
  TEST_ASSERT_EQUAL_STRING("A", g_out[0].id);
  TEST_ASSERT_EQUAL_STRING("B", g_out[1].id);
}

/**
 * @brief EMPTY INPUT -> NO LANES
 */
void test_empty_input() {
  TEST_ASSERT_EQUAL_UINT8(0, g_agg.aggregate(nullptr, 0, g_out, SCHED_MAX_LANES));
}

/* =========================
 *  UNITY TEST RUNNER (MAIN)
 * ========================= */
int main() {
  UNITY_BEGIN();
  RUN_TEST(test_emergency_keywords);
  RUN_TEST(test_counts_first_seen_order);
  RUN_TEST(test_sender_label_preferred);
  RUN_TEST(test_classifier_on_embedding);
  RUN_TEST(test_failures_degrade_to_normal);
  RUN_TEST(test_skip_and_drop);
  RUN_TEST(test_empty_input);
  return UNITY_END();
}
