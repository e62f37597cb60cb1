/**
 * @file PCF85063A.h
 * @brief Driver for NXP PCF85063A real-time clock (RTC)
 *
 * This library provides an interface for the PCF85063A, a low-power
 * real-time clock IC with I2C interface. The PCF85063A features:
 * - Time and calendar in BCD with oscillator-stopped detection
 * - Alarm on second, minute, hour, day and weekday
 * - Countdown timer with interrupt output
 * - Programmable CLKOUT output
 * - Offset register for frequency correction
 * - One byte of general purpose RAM
 *
 * @par Thread Safety
 * Not thread-safe unless Config::busLock / Config::busUnlock are supplied.
 * With a lock configured, each public operation holds the lock for its
 * whole register sequence.
 *
 * @par Usage Example
 * @code
 * #include "PCF85063A/PCF85063A.h"
 *
 * PCF85063A::PCF85063A rtc;
 *
 * void setup() {
 *   Wire.begin();
 *
 *   PCF85063A::Config cfg;
 *   cfg.i2cWrite = transport::wireWrite;
 *   cfg.i2cWriteRead = transport::wireWriteRead;
 *   cfg.i2cUser = &Wire;
 *
 *   PCF85063A::Status st = rtc.begin(cfg);
 *   if (!st.ok()) {
 *     Serial.printf("RTC init failed: %s\n", st.msg);
 *     return;
 *   }
 * }
 *
 * void loop() {
 *   PCF85063A::DateTime dt;
 *   bool stopped = false;
 *   if (rtc.readTime(dt, stopped).ok()) {
 *     Serial.printf("%04d-%02d-%02d %02d:%02d:%02d%s\n",
 *                   dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second,
 *                   stopped ? " (not trusted)" : "");
 *   }
 *   delay(1000);
 * }
 * @endcode
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "CommandTable.h"
#include "Config.h"
#include "Status.h"

namespace PCF85063A {

/**
 * @struct DateTime
 * @brief Date and time representation for RTC operations
 *
 * All values are in decimal (not BCD). Year is the full value; the device
 * stores two digits plus a century bit (set = 19xx, clear = 20xx).
 */
struct DateTime {
  uint16_t year = 0;     ///< Year (full value, range: 1900-2099)
  uint8_t month = 0;     ///< Month (1-12, 1=January)
  uint8_t day = 0;       ///< Day of month (1-31)
  uint8_t hour = 0;      ///< Hour (0-23, 24-hour format)
  uint8_t minute = 0;    ///< Minute (0-59)
  uint8_t second = 0;    ///< Second (0-59)
  uint8_t weekday = 0;   ///< Day of week (0-6), stored as supplied
};

/**
 * @enum AlarmFrequency
 * @brief How often an alarm repeats, as expressed by its match-enable bits
 */
enum class AlarmFrequency : uint8_t {
  Minutely = 0,  ///< Match second
  Hourly,        ///< Match second and minute
  Daily,         ///< Match second, minute and hour
  Weekly,        ///< Match second, minute, hour and weekday
  Monthly,       ///< Match second, minute, hour and day of month
  Yearly,        ///< Encoded as Monthly (no year match on the chip)
  Custom         ///< Decode only: enable pattern matches no row above
};

/**
 * @struct AlarmSpec
 * @brief Alarm time plus repeat frequency
 *
 * Only the time fields matched by the frequency are used. Year and month
 * are never used.
 */
struct AlarmSpec {
  DateTime time;                                  ///< Alarm time fields
  AlarmFrequency frequency = AlarmFrequency::Daily;  ///< Repeat frequency
};

/**
 * @enum ClkoutFrequency
 * @brief Clock output frequencies available on CLKOUT pin (COF bits)
 */
enum class ClkoutFrequency : uint8_t {
  Hz32768 = 0,  ///< 32.768 kHz (power-on default)
  Hz16384 = 1,  ///< 16.384 kHz
  Hz8192 = 2,   ///< 8.192 kHz
  Hz4096 = 3,   ///< 4.096 kHz
  Hz2048 = 4,   ///< 2.048 kHz
  Hz1024 = 5,   ///< 1.024 kHz
  Hz1 = 6,      ///< 1 Hz
  Disabled = 7  ///< CLKOUT high-impedance
};

/**
 * @enum TimerFrequency
 * @brief Countdown timer source clock (TCF bits)
 */
enum class TimerFrequency : uint8_t {
  Hz4096 = 0,   ///< 4096 Hz
  Hz64 = 1,     ///< 64 Hz
  Hz1 = 2,      ///< 1 Hz
  Hz1_60 = 3    ///< 1/60 Hz (power-on default)
};

/**
 * @struct TimerConfig
 * @brief Countdown timer configuration
 *
 * Period = value / frequency.
 */
struct TimerConfig {
  uint8_t value = 0;                                 ///< Countdown value (0-255)
  TimerFrequency frequency = TimerFrequency::Hz1_60; ///< Source clock
  bool enabled = false;                              ///< Timer running
  bool interruptEnabled = false;                     ///< Assert INT when timer elapses
  bool pulsed = false;                               ///< Pulsed INT instead of level
};

/**
 * @enum OffsetMode
 * @brief When the offset correction is applied (MODE bit)
 */
enum class OffsetMode : uint8_t {
  EveryTwoHours = 0,    ///< Normal mode, 4.34 ppm per step
  EveryFourMinutes = 1  ///< Coarse mode, 4.069 ppm per step
};

/**
 * @class PCF85063A
 * @brief Driver for the PCF85063A real-time clock
 *
 * @par Threading Model
 * Synchronous and blocking. Every call completes its bus transactions
 * before returning.
 *
 * @par Resource Ownership
 * I2C interface passed via Config. No hardcoded pins or resources.
 *
 * @par State
 * No register cache. The device registers are the only source of truth.
 *
 * @par Error Handling
 * All errors returned as Status. Transport errors are returned unchanged
 * and never retried. Range errors are raised before any bus transaction.
 */
class PCF85063A {
 public:
  /**
   * @brief Initialize RTC with configuration
   *
   * @param config Hardware and behavior configuration
   * @return OK on success, INVALID_CONFIG or DEVICE_NOT_FOUND otherwise
   * @note Transport must be ready (Wire.begin() called) before this.
   */
  Status begin(const Config& config);

  /**
   * @brief Stop and release resources
   *
   * @note No resources to release. Provided for API consistency.
   */
  void end();

  /**
   * @brief Check if library is initialized
   *
   * @return true if begin() succeeded
   */
  bool isInitialized() const { return _initialized; }

  /**
   * @brief Get current configuration
   *
   * @return Reference to active configuration
   */
  const Config& getConfig() const { return _config; }

  /**
   * @brief Check that the device answers on the bus
   *
   * @return OK if Control_1 could be read, DEVICE_NOT_FOUND otherwise
   */
  Status probe();

  // ===== Time/Date Operations =====

  /**
   * @brief Read current time and date from RTC
   *
   * @param[out] out Structure to receive current date/time
   * @param[out] oscillatorStopped true if the OS flag is set; the time
   *             is returned but cannot be trusted
   * @return Status::Ok() on success, error on I2C failure or corrupt registers
   */
  Status readTime(DateTime& out, bool& oscillatorStopped);

  /**
   * @brief Set RTC time and date
   *
   * @param time Date/time structure with values to set
   * @return Status::Ok() on success, INVALID_DATETIME or I2C error otherwise
   * @note Weekday is written as supplied. Clears the oscillator-stopped flag.
   */
  Status setTime(const DateTime& time);

  /**
   * @brief Read current time as Unix timestamp
   *
   * @param[out] out Unix timestamp (seconds since Jan 1, 1970 00:00:00 UTC)
   * @param[out] oscillatorStopped True when the OS flag is set (time not trustworthy)
   * @return Status::Ok() on success, error otherwise
   */
  Status readUnix(uint32_t& out, bool& oscillatorStopped);

  /**
   * @brief Set RTC time from Unix timestamp
   *
   * @param ts Unix timestamp (seconds since epoch)
   * @return Status::Ok() on success, error otherwise
   * @note Weekday is computed from the date.
   */
  Status setUnix(uint32_t ts);

  /**
   * @brief Read the oscillator-stopped (OS) flag
   *
   * @param[out] stopped true if the clock integrity is not guaranteed
   * @return Status::Ok() on success, error otherwise
   */
  Status readOscillatorStopped(bool& stopped);

  /**
   * @brief Clear the oscillator-stopped (OS) flag without changing the time
   *
   * @return Status::Ok() on success, error otherwise
   */
  Status clearOscillatorStopped();

  // ===== Alarm Operations =====

  /**
   * @brief Program the alarm registers
   *
   * @param alarm Alarm time and frequency
   * @return Status::Ok() on success, INVALID_PARAM or I2C error otherwise
   * @note Custom cannot be written. Does not touch the interrupt enable.
   */
  Status setAlarm(const AlarmSpec& alarm);

  /**
   * @brief Read the alarm registers
   *
   * @param[out] out Alarm time and the frequency matching its enable bits
   * @return Status::Ok() on success, error otherwise
   * @note Yearly alarms read back as Monthly.
   */
  Status getAlarm(AlarmSpec& out);

  /**
   * @brief Disable matching on all alarm fields
   *
   * @return Status::Ok() on success, error otherwise
   */
  Status disableAlarm();

  /**
   * @brief Check if alarm has triggered
   *
   * @param[out] triggered true if alarm triggered since last clear
   * @return Status::Ok() on success, error otherwise
   * @note Reading does not clear the flag.
   */
  Status readAlarmFlag(bool& triggered);

  /**
   * @brief Write the alarm flag
   *
   * @param value false clears the flag; true is ignored (only the device sets it)
   * @return Status::Ok() on success, error otherwise
   */
  Status writeAlarmFlag(bool value);

  /**
   * @brief Clear alarm triggered flag
   *
   * @return Status::Ok() on success, error otherwise
   */
  Status clearAlarmFlag();

  /**
   * @brief Enable or disable alarm interrupt output
   *
   * @param enable true to assert INT on alarm
   * @return Status::Ok() on success, error otherwise
   */
  Status setAlarmInterrupt(bool enable);

  /**
   * @brief Check if alarm interrupt is enabled
   *
   * @param[out] enabled true if alarm interrupt enabled
   * @return Status::Ok() on success, error otherwise
   */
  Status getAlarmInterrupt(bool& enabled);

  // ===== Timer Operations =====

  /**
   * @brief Configure countdown timer
   *
   * @param config Timer value, clock and interrupt settings
   * @return Status::Ok() on success, error otherwise
   */
  Status setTimer(const TimerConfig& config);

  /**
   * @brief Read countdown timer configuration and current value
   *
   * @param[out] out Timer configuration
   * @return Status::Ok() on success, error otherwise
   */
  Status getTimer(TimerConfig& out);

  Status readTimerFlag(bool& elapsed);
  Status clearTimerFlag();

  // ===== Clock Output Operations =====

  /**
   * @brief Set clock output frequency
   *
   * @param freq Desired output frequency, or Disabled
   * @return Status::Ok() on success, error otherwise
   */
  Status setClkoutFrequency(ClkoutFrequency freq);

  /**
   * @brief Read current clock output frequency
   *
   * @param[out] freq Current output frequency setting
   * @return Status::Ok() on success, error otherwise
   */
  Status getClkoutFrequency(ClkoutFrequency& freq);

  // ===== Oscillator Operations =====

  Status setLoadCapacitance(LoadCapacitance cap);
  Status getLoadCapacitance(LoadCapacitance& cap);

  /**
   * @brief Write the offset register
   *
   * @param mode Correction interval
   * @param value Offset steps (-64 to 63)
   * @return Status::Ok() on success, INVALID_PARAM or I2C error otherwise
   */
  Status setOffset(OffsetMode mode, int8_t value);

  /**
   * @brief Read the offset register
   *
   * @param[out] mode Correction interval
   * @param[out] value Offset steps (-64 to 63)
   * @return Status::Ok() on success, error otherwise
   */
  Status getOffset(OffsetMode& mode, int8_t& value);

  // ===== RAM Byte =====

  Status readRamByte(uint8_t& value);
  Status writeRamByte(uint8_t value);

  // ===== Low-Level Operations =====

  /**
   * @brief Read consecutive RTC registers in one transaction
   *
   * @param reg First register address
   * @param[out] buf Destination buffer
   * @param len Number of bytes (1-32)
   * @return Status::Ok() on success, error otherwise
   */
  Status readRegisters(uint8_t reg, uint8_t* buf, size_t len);

  /**
   * @brief Write consecutive RTC registers in one transaction
   *
   * @param reg First register address
   * @param buf Source buffer
   * @param len Number of bytes (1-15)
   * @return Status::Ok() on success, error otherwise
   * @warning Overwrites every bit of every register in range
   */
  Status writeRegisters(uint8_t reg, const uint8_t* buf, size_t len);

  /**
   * @brief Read single RTC register
   *
   * @param reg Register address
   * @param[out] value Register value read
   * @return Status::Ok() on success, error otherwise
   */
  Status readRegister(uint8_t reg, uint8_t& value);

  /**
   * @brief Write single RTC register
   *
   * @param reg Register address
   * @param value Value to write
   * @return Status::Ok() on success, error otherwise
   * @warning Direct register access can disrupt RTC operation if misused
   */
  Status writeRegister(uint8_t reg, uint8_t value);

  /**
   * @brief Read a bit field from one register
   *
   * @param reg Register address
   * @param mask Field mask (contiguous bits, non-zero)
   * @param[out] value Field value, shifted down to bit 0
   * @return Status::Ok() on success, error otherwise
   */
  Status readRegisterBits(uint8_t reg, uint8_t mask, uint8_t& value);

  /**
   * @brief Write a bit field in one register, preserving all other bits
   *
   * Performs one read and one write.
   *
   * @param reg Register address
   * @param mask Field mask (contiguous bits, non-zero)
   * @param value Field value, right-aligned (must fit in mask)
   * @return Status::Ok() on success, error otherwise
   */
  Status writeRegisterBits(uint8_t reg, uint8_t mask, uint8_t value);

  // ===== Static Codec Functions =====

  /**
   * @brief Pack a DateTime into the seven time registers
   *
   * @param time Date/time to encode
   * @param[out] regs Buffer of cmd::TIME_BLOCK_LEN bytes (seconds first)
   * @return Status::Ok() on success, INVALID_DATETIME if a field is out of range
   * @note The OS bit is always clear in the encoded seconds byte.
   */
  static Status encodeTime(const DateTime& time, uint8_t* regs);

  /**
   * @brief Unpack the seven time registers into a DateTime
   *
   * @param regs Buffer of cmd::TIME_BLOCK_LEN bytes (seconds first)
   * @param[out] out Decoded date/time (unchanged on error)
   * @param[out] oscillatorStopped OS flag from the seconds byte
   * @return Status::Ok() on success, INVALID_DATETIME on corrupt BCD or range
   */
  static Status decodeTime(const uint8_t* regs, DateTime& out, bool& oscillatorStopped);

  /**
   * @brief Pack an AlarmSpec into the five alarm registers
   *
   * @param alarm Alarm time and frequency
   * @param[out] regs Buffer of cmd::ALARM_BLOCK_LEN bytes (second first)
   * @return Status::Ok() on success, INVALID_PARAM on range error or Custom
   */
  static Status encodeAlarm(const AlarmSpec& alarm, uint8_t* regs);

  /**
   * @brief Unpack the five alarm registers into an AlarmSpec
   *
   * @param regs Buffer of cmd::ALARM_BLOCK_LEN bytes (second first)
   * @param[out] out Alarm; disabled fields read as 0 (unchanged on error)
   * @return Status::Ok() on success, INVALID_PARAM on corrupt enabled fields
   */
  static Status decodeAlarm(const uint8_t* regs, AlarmSpec& out);

  // ===== Static Utility Functions =====

  /**
   * @brief Check every field against its register range
   *
   * @param time Date/time structure to validate
   * @return true if all fields fit their registers
   * @note Does not check day against month length or weekday against date.
   */
  static bool isValidDateTime(const DateTime& time);

  /**
   * @brief Compute day of week from date
   *
   * @param year Full year (1900-2099)
   * @param month Month (1-12)
   * @param day Day of month (1-31)
   * @return Weekday (0-6, where 0=Sunday)
   */
  static uint8_t computeWeekday(uint16_t year, uint8_t month, uint8_t day);

  /**
   * @brief Parse compiler build date/time into DateTime
   *
   * @param[out] out Structure to receive parsed date/time
   * @return true if parsing successful, false otherwise
   */
  static bool parseBuildTime(DateTime& out);

  static bool isValidBcd(uint8_t v);

  /**
   * @brief Convert Unix timestamp to DateTime (1970-2099)
   *
   * @return false if the timestamp is beyond 2099
   */
  static bool unixToDateTime(uint32_t ts, DateTime& out);

  /**
   * @brief Convert DateTime to Unix timestamp
   *
   * @return false if the date is before 1970 or not a real calendar date
   */
  static bool dateTimeToUnix(const DateTime& time, uint32_t& out);

 private:
  Config _config;
  bool _initialized = false;
  bool _beginInProgress = false;

  // I2C operations (caller holds the bus lock)
  Status readRegs(uint8_t reg, uint8_t* buf, size_t len);
  Status writeRegs(uint8_t reg, const uint8_t* buf, size_t len);
  Status updateBits(uint8_t reg, uint8_t mask, uint8_t bits);

  // Conversion helpers
  static uint8_t bcdToBin(uint8_t v);
  static uint8_t binToBcd(uint8_t v);
  static bool isLeapYear(uint16_t year);
  static uint8_t daysInMonth(uint16_t year, uint8_t month);
  static uint32_t daysSince1900(uint16_t year, uint8_t month, uint8_t day);
};

}  // namespace PCF85063A
