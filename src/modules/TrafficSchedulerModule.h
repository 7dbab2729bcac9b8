/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Module  : Traffic Scheduler Mesh Front-End               *
 **************************************************************/
#pragma once

#include <Arduino.h>

#include "concurrency/OSThread.h"
#include "mesh/SinglePortModule.h"
#include "mesh/generated/meshtastic/portnums.pb.h"
#include "scheduler/SchedulerHost.h"

/* =======================[ DEFAULT CONFIG (OVERRIDE VIA -D ...) ]=======================
 *  STANDALONE SIMULATION (NO FEEDER ON THE MESH):
 *    -DSCHED_STANDALONE_LANES=0       -> >0 REGISTERS Lane_1..Lane_N AT BOOT
 *    -DSCHED_FEED_TIMEOUT_MS=10000    -> SILENCE BEFORE THE NODE SIMULATES ON ITS OWN
 *    -DSCHED_BROADCAST_REPORTS=1      -> BROADCAST EVERY SIMULATED R FRAME
 *
 *  LOCAL SIGNAL HEAD:
 *    -DSCHED_LOCAL_LANE_ID="Lane_1"   -> LANE SHOWN ON THE STATUS LEDS
 *    -DSCHED_LED_RED_PIN=-1
 *    -DSCHED_LED_AMBER_PIN=-1
 *    -DSCHED_LED_GREEN_PIN=-1
 *    -DSCHED_AMBER_BLINK_MS=500       -> NO LANE SET / LOCAL LANE UNKNOWN
 *
 *  THREAD:
 *    -DSCHED_TICK_MS=50
 * =====================================================================================*/

#ifndef SCHED_STANDALONE_LANES
  #define SCHED_STANDALONE_LANES 0
#endif
#ifndef SCHED_FEED_TIMEOUT_MS
  #define SCHED_FEED_TIMEOUT_MS 10000U
#endif
#ifndef SCHED_BROADCAST_REPORTS
  #define SCHED_BROADCAST_REPORTS 1
#endif

#ifndef SCHED_LOCAL_LANE_ID
  #define SCHED_LOCAL_LANE_ID "Lane_1"
#endif
#ifndef SCHED_LED_RED_PIN
  #define SCHED_LED_RED_PIN -1
#endif
#ifndef SCHED_LED_AMBER_PIN
  #define SCHED_LED_AMBER_PIN -1
#endif
#ifndef SCHED_LED_GREEN_PIN
  #define SCHED_LED_GREEN_PIN -1
#endif
#ifndef SCHED_AMBER_BLINK_MS
  #define SCHED_AMBER_BLINK_MS 500U
#endif

#ifndef SCHED_TICK_MS
  #define SCHED_TICK_MS 50
#endif

/* ===============================[ MAIN CLASS ]================================ */
class TrafficSchedulerModule final : public SinglePortModule, public concurrency::OSThread {
public:
  static constexpr meshtastic_PortNum kPort = meshtastic_PortNum_PRIVATE_APP;

  TrafficSchedulerModule();

  /* OSTHREAD */
  int32_t runOnce() override;

  /* RX ON MESH (CSV-in-payload) */
  ProcessMessage     handleReceived(const meshtastic_MeshPacket&) override;
  meshtastic_PortNum getPortNum() const {
    return kPort;
  }

private:
  /* ---------- INIT ---------- */
  void initOnce();

  /* ---------- MESH TX ---------- */
  void sendPayload_(const char* buf, size_t len, NodeNum to);

  /* ---------- STANDALONE ---------- */
  void standaloneTick_(uint32_t now);

  /* ---------- STATUS LEDS (OPTIONAL) ---------- */
  inline bool ledsPresent();
  inline void leds(bool r, bool a, bool g);
  void        applyLocalLane_(uint32_t now);

  /* ---------- STATE ---------- */
  bool ready_ = false;

  SchedulerHost host_;
  LaneReport    report_;

  /* FEED WATCH */
  bool     fed_        = false;
  uint32_t lastFeedMs_ = 0;

  /* SCRATCH (ONE FRAME IN, ONE FRAME OUT) */
  char rx_[SCHED_FRAME_MAX];
  char tx_[SCHED_FRAME_MAX];
};
