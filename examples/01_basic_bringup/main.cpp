/**
 * @file main.cpp
 * @brief Bring-up example for the PCF85063A RTC
 *
 * Demonstrates the basic RTC flow:
 * - Oscillator-stopped check after power loss
 * - Setting the time from the firmware build timestamp
 * - Daily alarm with flag polling (or INT pin, when wired)
 * - Clearing the alarm flag once handled
 */

#include <Arduino.h>
#include <Wire.h>

#include "examples/common/BoardPins.h"
#include "examples/common/I2cTransport.h"
#include "examples/common/Log.h"
#include "PCF85063A/CommandTable.h"
#include "PCF85063A/PCF85063A.h"

static PCF85063A::PCF85063A g_rtc;
static bool g_ready = false;
static uint32_t g_lastPrintMs = 0;

static constexpr uint32_t kPrintIntervalMs = 5000;
static constexpr uint8_t kAlarmHour = 7;
static constexpr uint8_t kAlarmMinute = 30;

/**
 * @brief Convert Err enum to string.
 */
static const char* errToStr(PCF85063A::Err code) {
  switch (code) {
    case PCF85063A::Err::OK:               return "OK";
    case PCF85063A::Err::NOT_INITIALIZED:  return "NOT_INITIALIZED";
    case PCF85063A::Err::INVALID_CONFIG:   return "INVALID_CONFIG";
    case PCF85063A::Err::I2C_ERROR:        return "I2C_ERROR";
    case PCF85063A::Err::TIMEOUT:          return "TIMEOUT";
    case PCF85063A::Err::INVALID_PARAM:    return "INVALID_PARAM";
    case PCF85063A::Err::INVALID_DATETIME: return "INVALID_DATETIME";
    case PCF85063A::Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case PCF85063A::Err::BUS_BUSY:         return "BUS_BUSY";
    default: return "UNKNOWN";
  }
}

static const char* freqToStr(PCF85063A::AlarmFrequency freq) {
  switch (freq) {
    case PCF85063A::AlarmFrequency::Minutely: return "minutely";
    case PCF85063A::AlarmFrequency::Hourly:   return "hourly";
    case PCF85063A::AlarmFrequency::Daily:    return "daily";
    case PCF85063A::AlarmFrequency::Weekly:   return "weekly";
    case PCF85063A::AlarmFrequency::Monthly:  return "monthly";
    case PCF85063A::AlarmFrequency::Yearly:   return "yearly";
    case PCF85063A::AlarmFrequency::Custom:   return "custom";
    default: return "unknown";
  }
}

static void logFailure(const char* op, const PCF85063A::Status& st) {
  LOGE("%s failed: %s (code=%s, detail=%ld)",
       op, st.msg, errToStr(st.code), static_cast<long>(st.detail));
}

/**
 * @brief Format and print DateTime structure.
 */
static void print_datetime(const PCF85063A::DateTime& dt, bool stopped) {
  Serial.printf("%04d-%02d-%02d %02d:%02d:%02d (weekday=%d)%s%s%s\n",
                dt.year, dt.month, dt.day,
                dt.hour, dt.minute, dt.second,
                dt.weekday,
                stopped ? LOG_COLOR_YELLOW : "",
                stopped ? " [oscillator stopped]" : "",
                stopped ? LOG_COLOR_RESET : "");
}

/**
 * @brief Restore the clock after power loss.
 *
 * A set OS flag means the time registers are not trustworthy. The build
 * timestamp is the best available reference on a bench.
 */
static bool restoreTimeIfLost() {
  bool stopped = false;
  PCF85063A::Status st = g_rtc.readOscillatorStopped(stopped);
  if (!st.ok()) {
    logFailure("readOscillatorStopped()", st);
    return false;
  }
  if (!stopped) {
    LOGI("Oscillator running, keeping RTC time");
    return true;
  }

  LOGW("Oscillator was stopped, time lost");
  PCF85063A::DateTime build;
  if (!PCF85063A::PCF85063A::parseBuildTime(build)) {
    LOGE("parseBuildTime() failed");
    return false;
  }

  // Clears OS as part of the write
  st = g_rtc.setTime(build);
  if (!st.ok()) {
    logFailure("setTime()", st);
    return false;
  }
  LOGI("Time set to build timestamp");
  return true;
}

static bool armDailyAlarm() {
  PCF85063A::AlarmSpec alarm;
  alarm.frequency = PCF85063A::AlarmFrequency::Daily;
  alarm.time.hour = kAlarmHour;
  alarm.time.minute = kAlarmMinute;
  alarm.time.second = 0;

  PCF85063A::Status st = g_rtc.clearAlarmFlag();
  if (!st.ok()) {
    logFailure("clearAlarmFlag()", st);
    return false;
  }
  st = g_rtc.setAlarm(alarm);
  if (!st.ok()) {
    logFailure("setAlarm()", st);
    return false;
  }
  st = g_rtc.setAlarmInterrupt(pins::RTC_INT >= 0);
  if (!st.ok()) {
    logFailure("setAlarmInterrupt()", st);
    return false;
  }

  PCF85063A::AlarmSpec readBack;
  st = g_rtc.getAlarm(readBack);
  if (!st.ok()) {
    logFailure("getAlarm()", st);
    return false;
  }
  LOGI("Alarm armed: %02d:%02d:%02d %s",
       readBack.time.hour, readBack.time.minute, readBack.time.second,
       freqToStr(readBack.frequency));
  return true;
}

static void serviceAlarm() {
  // INT is active low; skip the bus read while it is released
  if (pins::RTC_INT >= 0 && digitalRead(pins::RTC_INT) == HIGH) {
    return;
  }

  bool triggered = false;
  PCF85063A::Status st = g_rtc.readAlarmFlag(triggered);
  if (!st.ok()) {
    logFailure("readAlarmFlag()", st);
    return;
  }
  if (!triggered) {
    return;
  }

  LOGI("%sAlarm fired%s", LOG_COLOR_GREEN, LOG_COLOR_RESET);
  st = g_rtc.clearAlarmFlag();
  if (!st.ok()) {
    logFailure("clearAlarmFlag()", st);
  }
}

void setup() {
  delay(1000);  // USB-CDC enumeration delay
  Serial.begin(115200);
  while (!Serial && millis() < 4000) {
    delay(10);
  }

  LOGI("Initializing I2C (SDA=%d, SCL=%d)...", pins::I2C_SDA, pins::I2C_SCL);
  if (!transport::initWire(pins::I2C_SDA, pins::I2C_SCL, pins::I2C_FREQ_HZ)) {
    LOGE("I2C init failed");
    return;
  }
  if (pins::RTC_INT >= 0) {
    pinMode(pins::RTC_INT, INPUT_PULLUP);
  }

  LOGI("Initializing RTC at 0x%02X...", PCF85063A::cmd::I2C_ADDR_7BIT);
  PCF85063A::Config cfg;
  cfg.i2cWrite = transport::wireWrite;
  cfg.i2cWriteRead = transport::wireWriteRead;
  cfg.i2cUser = &Wire;
  cfg.applyCapacitance = true;
  cfg.capacitance = PCF85063A::LoadCapacitance::Pf12_5;

  PCF85063A::Status st = g_rtc.begin(cfg);
  if (!st.ok()) {
    logFailure("begin()", st);
    LOGE("Check I2C wiring and RTC power");
    return;
  }
  LOGI("RTC initialized successfully");

  if (!restoreTimeIfLost() || !armDailyAlarm()) {
    return;
  }
  g_ready = true;
}

void loop() {
  if (!g_ready) {
    delay(1000);
    return;
  }

  serviceAlarm();

  const uint32_t now = millis();
  if (now - g_lastPrintMs >= kPrintIntervalMs) {
    g_lastPrintMs = now;
    PCF85063A::DateTime dt;
    bool stopped = false;
    PCF85063A::Status st = g_rtc.readTime(dt, stopped);
    if (st.ok()) {
      print_datetime(dt, stopped);
    } else {
      logFailure("readTime()", st);
    }
  }

  delay(50);
}
