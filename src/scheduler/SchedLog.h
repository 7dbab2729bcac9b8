/**************************************************************
 *   Project : Adaptive Traffic Signal Scheduler              *
 *   Util    : Log Gate                                       *
 **************************************************************/
#pragma once

/**************************************************************
 *   LOGGING CONFIGURATION                                    *
 *   - SCHED_LOG_LEVEL: [0=OFF, 1=INFO, 2=DEBUG]              *
 *   - DEFINE LOG_TAG BEFORE INCLUDING THIS HEADER.           *
 *                                                            *
 *   ROUTES SCHED_LOGI/W/E/D ONTO THE FIRMWARE LOG MACROS.    *
 *   HOST TEST BUILDS USE LEVEL 0.                            *
 **************************************************************/
#ifndef SCHED_LOG_LEVEL
  #define SCHED_LOG_LEVEL 1
#endif

#if SCHED_LOG_LEVEL >= 1
  #include "configuration.h"
  #define SCHED_LOGI(...) LOG_INFO(__VA_ARGS__)
  #define SCHED_LOGW(...) LOG_WARN(__VA_ARGS__)
  #define SCHED_LOGE(...) LOG_ERROR(__VA_ARGS__)
#else
  #define SCHED_LOGI(...)                                                                          \
    do {                                                                                           \
    } while (0)
  #define SCHED_LOGW(...)                                                                          \
    do {                                                                                           \
    } while (0)
  #define SCHED_LOGE(...)                                                                          \
    do {                                                                                           \
    } while (0)
#endif

#if SCHED_LOG_LEVEL >= 2
  #define SCHED_LOGD(...) LOG_DEBUG(__VA_ARGS__)
#else
  #define SCHED_LOGD(...)                                                                          \
    do {                                                                                           \
    } while (0)
#endif
