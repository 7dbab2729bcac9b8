/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Library : Lane Selectors & Green-Time Estimator          *
 **************************************************************/

#ifndef LANESELECTORS_H
#define LANESELECTORS_H

#include "scheduler/LaneTypes.h"
#include "scheduler/SchedulerConfig.h"

/**
 * PICK THE EMERGENCY LANE (PRIORITY PREEMPTION)
 *
 * HIGHEST 'emergency' AMONG LANES WITH emergency > 0. TIES ARE BROKEN BY A
 * CIRCULAR SCAN OF REGISTRATION ORDER STARTING RIGHT AFTER 'lastEmergency'.
 *
 * @param lanes          WORKING SNAPSHOT, REGISTRATION ORDER
 * @param count          NUMBER OF LANES
 * @param lastEmergency  IN/OUT: LAST LANE GRANTED FOR AN EMERGENCY (-1 = NONE);
 *                       UPDATED TO THE CHOSEN LANE ON EVERY SELECTION
 * @return               CHOSEN INDEX, OR -1 IF NO LANE REPORTS AN EMERGENCY
 */
int8_t SEL_emergencyLane(const LaneState* lanes, uint8_t count, int8_t& lastEmergency);

/**
 * FAIRNESS SCORE OF ONE LANE
 *
 * normal * (1 + wait * waitBoost), PLUS THE STARVATION BONUS ONCE
 * wait >= starvationLimit.
 */
float SEL_fairScore(const LaneState& lane, const SchedulerConfig& cfg);

/**
 * PICK THE LANE WITH THE MAXIMUM FAIRNESS SCORE
 *
 * @return FIRST LANE (REGISTRATION ORDER) REACHING THE MAXIMUM, -1 IF count == 0
 */
int8_t SEL_fairLane(const LaneState* lanes, uint8_t count, const SchedulerConfig& cfg);

/**
 * GREEN TIME FOR THE CHOSEN LANE (SECONDS)
 *
 * normal / clearanceRate + wait * 0.4 + emergency * 2.0,
 * CLAMPED TO [minGreenS, maxGreenS]. PURE.
 */
float SEL_greenTimeS(const LaneState& lane, const SchedulerConfig& cfg);

#endif
