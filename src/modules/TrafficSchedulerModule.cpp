/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Traffic Scheduler Mesh Front-End               *
 **************************************************************/

#include "TrafficSchedulerModule.h"

#include <stdlib.h>
#include <string.h>

#include "Channels.h"
#include "configuration.h"
#include "mesh/MeshService.h"
#include "mesh/generated/meshtastic/mesh.pb.h"

/* =====================================[ LOG TAG ]===================================== */
#ifndef LOG_TAG
  #define LOG_TAG "TrafficSched"
#endif

/* ===============================[ MESHTASTIC EXTERNS ]================================= */
extern MeshService* service;
extern Channels     channels;

/* ==================================== CONSTRUCTOR ===================================== */
TrafficSchedulerModule::TrafficSchedulerModule()
    : SinglePortModule("traffic_scheduler", kPort), concurrency::OSThread("TrafficSched") {}

/* ==================================== INIT ONCE ======================================= */
void TrafficSchedulerModule::initOnce() {
  if (ready_)
    return;

  /* OPTIONAL STATUS LEDS */
  if (ledsPresent()) {
    pinMode(SCHED_LED_RED_PIN, OUTPUT);
    pinMode(SCHED_LED_AMBER_PIN, OUTPUT);
    pinMode(SCHED_LED_GREEN_PIN, OUTPUT);
    leds(true, false, false); /* SAFE START -> RED */
  }

  /* SEED THE DEMAND MODEL PER NODE */
  host_.seedDemand((uint32_t) SCHED_DEMAND_SEED ^ millis());

#if (SCHED_STANDALONE_LANES > 0)
  host_.beginStandalone((uint8_t) SCHED_STANDALONE_LANES);
#endif

  LOG_INFO("TrafficSched: ready (standalone=%u, local lane '%s')\n",
           (unsigned) SCHED_STANDALONE_LANES,
           SCHED_LOCAL_LANE_ID);
  ready_ = true;
}

/* ==================================== LEDS ============================================ */
inline bool TrafficSchedulerModule::ledsPresent() {
  return (SCHED_LED_RED_PIN >= 0 && SCHED_LED_AMBER_PIN >= 0 && SCHED_LED_GREEN_PIN >= 0);
}
inline void TrafficSchedulerModule::leds(bool r, bool a, bool g) {
  if (SCHED_LED_RED_PIN >= 0)
    digitalWrite(SCHED_LED_RED_PIN, r ? HIGH : LOW);
  if (SCHED_LED_AMBER_PIN >= 0)
    digitalWrite(SCHED_LED_AMBER_PIN, a ? HIGH : LOW);
  if (SCHED_LED_GREEN_PIN >= 0)
    digitalWrite(SCHED_LED_GREEN_PIN, g ? HIGH : LOW);
}

/**
 * LOCAL HEAD:
 *  - LANE GREEN           -> GREEN (AMBER DURING THE LAST yellowS OF THE ALLOTMENT)
 *  - LANE RED             -> RED
 *  - NO LANE SET / UNKNOWN -> AMBER BLINK
 */
void TrafficSchedulerModule::applyLocalLane_(uint32_t now) {
  if (!ledsPresent())
    return;

  const LaneScheduler& core = host_.scheduler();
  const int8_t         i    = host_.live() ? core.lanes().indexOf(SCHED_LOCAL_LANE_ID) : -1;
  if (i < 0) {
    const bool on = ((now / SCHED_AMBER_BLINK_MS) & 1) != 0;
    leds(false, on, false);
    return;
  }

  if (core.lanes().at((uint8_t) i).phase != LP_GREEN) {
    leds(true, false, false);
    return;
  }

  const SchedulerStatus s       = core.inspect();
  const uint32_t        yellow  = (uint32_t) (s.yellowS * 1000.0f);
  const int32_t         elapsed = (int32_t) (now - s.greenStartMs);
  const bool            amber   = (elapsed >= 0) && ((uint32_t) elapsed + yellow >= s.greenMs);
  leds(false, amber, !amber);
}

/* ==================================== MESH TX ========================================= */
void TrafficSchedulerModule::sendPayload_(const char* buf, size_t len, NodeNum to) {
  meshtastic_MeshPacket* pkt = (meshtastic_MeshPacket*) calloc(1, sizeof(*pkt));
  if (!pkt) {
    LOG_ERROR("TrafficSched: tx OOM\n");
    return;
  }

  pkt->to       = to;
  pkt->channel  = channels.getPrimaryIndex();
  pkt->want_ack = false;

  pkt->which_payload_variant = meshtastic_MeshPacket_decoded_tag;
  pkt->decoded.portnum       = kPort;
  pkt->decoded.want_response = false;

  const size_t n = (len < sizeof(pkt->decoded.payload.bytes)) ? len : sizeof(pkt->decoded.payload.bytes);
  pkt->decoded.payload.size = n;
  memcpy(pkt->decoded.payload.bytes, buf, n);

  service->sendToMesh(pkt);
  LOG_DEBUG("TrafficSched: tx -> 0x%08x %.*s", (unsigned) to, (int) n, buf);
}

/* ==================================== MESH RX ========================================= */
/*
 * OSTHREADS AND MODULE CALLBACKS SHARE THE COOPERATIVE MAIN LOOP: handleReceived()
 * AND runOnce() NEVER OVERLAP, SO EVERY HOST CALL IS ALREADY SERIALIZED.
 */
ProcessMessage TrafficSchedulerModule::handleReceived(const meshtastic_MeshPacket& p) {
  if (p.which_payload_variant != meshtastic_MeshPacket_decoded_tag)
    return ProcessMessage::CONTINUE;
  if (p.decoded.portnum != kPort)
    return ProcessMessage::CONTINUE;

  const size_t n = p.decoded.payload.size;
  if (n == 0 || n >= sizeof(rx_))
    return ProcessMessage::CONTINUE;

  memcpy(rx_, p.decoded.payload.bytes, n);
  rx_[n] = '\0';

  /* R/S/E ARE REPLIES FROM PEERS, NOT REQUESTS */
  const char t = rx_[0];
  if (t == 'R' || t == 'S' || t == 'E')
    return ProcessMessage::CONTINUE;

  if (!ready_)
    initOnce();

  /* ONE MESH PAYLOAD PER REPLY (+1 FOR THE NUL) */
  const size_t txMax = ((size_t) meshtastic_Constants_DATA_PAYLOAD_LEN < sizeof(tx_))
                           ? (size_t) meshtastic_Constants_DATA_PAYLOAD_LEN + 1
                           : sizeof(tx_);

  const uint32_t now = millis();
  const size_t   L   = host_.handleLine(rx_, now, tx_, txMax);
  if (L == 0) {
    LOG_DEBUG("TrafficSched: rx dropped from 0x%08x\n", (unsigned) p.from);
    return ProcessMessage::CONTINUE;
  }

  if (t == 'U' || t == 'K') {
    fed_        = true;
    lastFeedMs_ = now;
  }

  sendPayload_(tx_, L, p.from);
  applyLocalLane_(now);
  return ProcessMessage::CONTINUE;
}

/* ==================================== STANDALONE ====================================== */
void TrafficSchedulerModule::standaloneTick_(uint32_t now) {
  if (!host_.live())
    return;
  if (fed_ && (int32_t) (now - lastFeedMs_) < (int32_t) SCHED_FEED_TIMEOUT_MS)
    return;
  if (host_.scheduler().greenActive(now))
    return;

  if (host_.simulateStep(now, report_) < 0)
    return;

#if SCHED_BROADCAST_REPORTS
  const size_t L = host_.encodeReport(report_, tx_, sizeof(tx_));
  if (L > 0)
    sendPayload_(tx_, L, NODENUM_BROADCAST);
  else
    LOG_WARN("TrafficSched: report does not fit in one frame\n");
#endif
}

/* ===================================== RUN ONCE ======================================= */
int32_t TrafficSchedulerModule::runOnce() {
  if (!ready_)
    initOnce();

  const uint32_t now = millis();

#if (SCHED_STANDALONE_LANES > 0)
  standaloneTick_(now);
#endif

  applyLocalLane_(now);

  return SCHED_TICK_MS; /* RUN AGAIN IN 'SCHED_TICK_MS' */
}
