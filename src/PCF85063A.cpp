/**
 * @file PCF85063A.cpp
 * @brief Implementation of PCF85063A RTC driver
 */

#include "PCF85063A/PCF85063A.h"
#include "PCF85063A/CommandTable.h"
#include <cstdio>
#include <cstring>

namespace PCF85063A {

// Implementation-only constants (not part of public API)
namespace {
constexpr uint8_t kMaxClkoutFrequency = static_cast<uint8_t>(ClkoutFrequency::Disabled);
constexpr uint8_t kMaxTimerFrequency = static_cast<uint8_t>(TimerFrequency::Hz1_60);
constexpr uint8_t kMaxLoadCapacitance = static_cast<uint8_t>(LoadCapacitance::Pf12_5);
constexpr uint8_t kMaxOffsetMode = static_cast<uint8_t>(OffsetMode::EveryFourMinutes);
constexpr int8_t kOffsetMin = -64;
constexpr int8_t kOffsetMax = 63;
constexpr size_t kMaxReadLen = 32;
constexpr uint32_t kDays1900To1970 = 25567;

// Alarm match-enable pattern, one bit per alarm register (bit 0 = second).
constexpr uint8_t kMatchSecond = 1u << 0;
constexpr uint8_t kMatchMinute = 1u << 1;
constexpr uint8_t kMatchHour = 1u << 2;
constexpr uint8_t kMatchDay = 1u << 3;
constexpr uint8_t kMatchWeekday = 1u << 4;

struct AlarmRow {
  AlarmFrequency frequency;
  uint8_t match;
};

// Monthly precedes Yearly so the shared pattern decodes as Monthly.
constexpr AlarmRow kAlarmRows[] = {
  {AlarmFrequency::Minutely, kMatchSecond},
  {AlarmFrequency::Hourly, kMatchSecond | kMatchMinute},
  {AlarmFrequency::Daily, kMatchSecond | kMatchMinute | kMatchHour},
  {AlarmFrequency::Weekly, kMatchSecond | kMatchMinute | kMatchHour | kMatchWeekday},
  {AlarmFrequency::Monthly, kMatchSecond | kMatchMinute | kMatchHour | kMatchDay},
  {AlarmFrequency::Yearly, kMatchSecond | kMatchMinute | kMatchHour | kMatchDay},
};

constexpr size_t kAlarmRowCount = sizeof(kAlarmRows) / sizeof(kAlarmRows[0]);

Status mapPresenceError(const Status& st) {
  if (st.isTransportError()) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "RTC not responding", st.detail);
  }
  return st;
}

/// @brief Position of the lowest set bit. mask must be non-zero.
uint8_t fieldShift(uint8_t mask) {
  uint8_t shift = 0;
  while (((mask >> shift) & 1u) == 0) {
    ++shift;
  }
  return shift;
}

/// @brief Holds the optional bus lock for one logical operation.
/// Releases on every exit path once acquired.
class BusGuard {
 public:
  explicit BusGuard(const Config& config) : _config(config) {
    if (_config.busLock == nullptr) {
      return;
    }
    Status st = _config.busLock(_config.lockTimeoutMs, _config.lockUser);
    if (!st.ok()) {
      _status = Status::Error(Err::BUS_BUSY, "Bus lock not acquired",
                              st.detail);
      return;
    }
    _held = true;
  }

  ~BusGuard() {
    if (_held) {
      _config.busUnlock(_config.lockUser);
    }
  }

  BusGuard(const BusGuard&) = delete;
  BusGuard& operator=(const BusGuard&) = delete;

  bool ok() const { return _status.ok(); }
  const Status& status() const { return _status; }

 private:
  const Config& _config;
  Status _status = Status::Ok();
  bool _held = false;
};
}  // namespace

// ===== Lifecycle Functions =====

Status PCF85063A::begin(const Config& config) {
  if (_initialized) {
    end();
  }

  // Validate configuration FIRST - don't modify any state until validation passes
  if (!config.i2cWrite || !config.i2cWriteRead) {
    return Status::Error(Err::INVALID_CONFIG, "I2C transport callbacks are null");
  }
  if (config.i2cAddress != cmd::I2C_ADDR_7BIT) {
    return Status::Error(Err::INVALID_CONFIG, "PCF85063A I2C address must be 0x51");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if ((config.busLock == nullptr) != (config.busUnlock == nullptr)) {
    return Status::Error(Err::INVALID_CONFIG, "Bus lock and unlock must be set together");
  }
  if (static_cast<uint8_t>(config.capacitance) > kMaxLoadCapacitance) {
    return Status::Error(Err::INVALID_CONFIG, "Load capacitance out of range");
  }

  _config = config;
  _initialized = false;
  _beginInProgress = true;

  Status st = probe();
  if (!st.ok()) {
    _beginInProgress = false;
    return st;
  }

  if (_config.applyCapacitance) {
    BusGuard guard(_config);
    if (!guard.ok()) {
      _beginInProgress = false;
      return guard.status();
    }
    const uint8_t capBit = static_cast<uint8_t>(1u << cmd::CTRL1_CAP_SEL_BIT);
    st = updateBits(cmd::REG_CONTROL1, capBit,
                    (_config.capacitance == LoadCapacitance::Pf12_5) ? capBit : 0);
    if (!st.ok()) {
      _beginInProgress = false;
      return st;
    }
  }

  _initialized = true;
  _beginInProgress = false;
  return Status::Ok();
}

void PCF85063A::end() {
  _initialized = false;
  _beginInProgress = false;
  // No resources to release (I2C managed by application)
}

Status PCF85063A::probe() {
  if (!_initialized && !_beginInProgress) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  // Value unused - we only verify I2C communication works
  uint8_t control1 = 0;
  Status st = readRegs(cmd::REG_CONTROL1, &control1, 1);
  return mapPresenceError(st);
}

// ===== Time/Date Operations =====

Status PCF85063A::readTime(DateTime& out, bool& oscillatorStopped) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t buf[cmd::TIME_BLOCK_LEN] = {0};
  Status st = readRegs(cmd::REG_SECONDS, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  return decodeTime(buf, out, oscillatorStopped);
}

Status PCF85063A::setTime(const DateTime& time) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  // Encode before taking the bus so a rejected value never reaches the device
  uint8_t buf[cmd::TIME_BLOCK_LEN] = {0};
  Status st = encodeTime(time, buf);
  if (!st.ok()) {
    return st;
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return writeRegs(cmd::REG_SECONDS, buf, sizeof(buf));
}

Status PCF85063A::readUnix(uint32_t& out, bool& oscillatorStopped) {
  DateTime dt;
  Status st = readTime(dt, oscillatorStopped);
  if (!st.ok()) {
    return st;
  }

  if (!dateTimeToUnix(dt, out)) {
    return Status::Error(Err::INVALID_DATETIME, "RTC time outside Unix range");
  }
  return Status::Ok();
}

Status PCF85063A::setUnix(uint32_t ts) {
  DateTime dt;
  if (!unixToDateTime(ts, dt)) {
    return Status::Error(Err::INVALID_DATETIME, "Unix timestamp out of range");
  }
  return setTime(dt);
}

Status PCF85063A::readOscillatorStopped(bool& stopped) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t seconds = 0;
  Status st = readRegs(cmd::REG_SECONDS, &seconds, 1);
  if (!st.ok()) {
    return st;
  }

  stopped = ((seconds & (1u << cmd::SECONDS_OS_BIT)) != 0);
  return Status::Ok();
}

Status PCF85063A::clearOscillatorStopped() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return updateBits(cmd::REG_SECONDS, static_cast<uint8_t>(1u << cmd::SECONDS_OS_BIT), 0);
}

// ===== Alarm Operations =====

Status PCF85063A::setAlarm(const AlarmSpec& alarm) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  uint8_t buf[cmd::ALARM_BLOCK_LEN] = {0};
  Status st = encodeAlarm(alarm, buf);
  if (!st.ok()) {
    return st;
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return writeRegs(cmd::REG_ALARM_SECOND, buf, sizeof(buf));
}

Status PCF85063A::getAlarm(AlarmSpec& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t buf[cmd::ALARM_BLOCK_LEN] = {0};
  Status st = readRegs(cmd::REG_ALARM_SECOND, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  return decodeAlarm(buf, out);
}

Status PCF85063A::disableAlarm() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t buf[cmd::ALARM_BLOCK_LEN];
  std::memset(buf, cmd::ALARM_DISABLE, sizeof(buf));
  return writeRegs(cmd::REG_ALARM_SECOND, buf, sizeof(buf));
}

Status PCF85063A::readAlarmFlag(bool& triggered) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t control2 = 0;
  Status st = readRegs(cmd::REG_CONTROL2, &control2, 1);
  if (!st.ok()) {
    return st;
  }

  triggered = ((control2 & (1u << cmd::CTRL2_AF_BIT)) != 0);
  return Status::Ok();
}

Status PCF85063A::writeAlarmFlag(bool value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  // Only the device sets AF
  if (value) {
    return Status::Ok();
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return updateBits(cmd::REG_CONTROL2, static_cast<uint8_t>(1u << cmd::CTRL2_AF_BIT), 0);
}

Status PCF85063A::clearAlarmFlag() {
  return writeAlarmFlag(false);
}

Status PCF85063A::setAlarmInterrupt(bool enable) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  const uint8_t aie = static_cast<uint8_t>(1u << cmd::CTRL2_AIE_BIT);
  return updateBits(cmd::REG_CONTROL2, aie, enable ? aie : 0);
}

Status PCF85063A::getAlarmInterrupt(bool& enabled) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t control2 = 0;
  Status st = readRegs(cmd::REG_CONTROL2, &control2, 1);
  if (!st.ok()) {
    return st;
  }

  enabled = ((control2 & (1u << cmd::CTRL2_AIE_BIT)) != 0);
  return Status::Ok();
}

// ===== Timer Operations =====

Status PCF85063A::setTimer(const TimerConfig& config) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  const uint8_t freqRaw = static_cast<uint8_t>(config.frequency);
  if (freqRaw > kMaxTimerFrequency) {
    return Status::Error(Err::INVALID_PARAM, "Timer frequency out of range");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  // Stop the timer before loading a new value
  const uint8_t te = static_cast<uint8_t>(1u << cmd::TIMER_TE_BIT);
  Status st = updateBits(cmd::REG_TIMER_MODE, te, 0);
  if (!st.ok()) {
    return st;
  }

  st = writeRegs(cmd::REG_TIMER_VALUE, &config.value, 1);
  if (!st.ok()) {
    return st;
  }

  const uint8_t modeMask = static_cast<uint8_t>(cmd::TIMER_TCF_MASK | te |
                                                (1u << cmd::TIMER_TIE_BIT) |
                                                (1u << cmd::TIMER_TI_TP_BIT));
  uint8_t mode = static_cast<uint8_t>((freqRaw << cmd::TIMER_TCF_SHIFT) & cmd::TIMER_TCF_MASK);
  if (config.enabled) {
    mode = static_cast<uint8_t>(mode | te);
  }
  if (config.interruptEnabled) {
    mode = static_cast<uint8_t>(mode | (1u << cmd::TIMER_TIE_BIT));
  }
  if (config.pulsed) {
    mode = static_cast<uint8_t>(mode | (1u << cmd::TIMER_TI_TP_BIT));
  }
  return updateBits(cmd::REG_TIMER_MODE, modeMask, mode);
}

Status PCF85063A::getTimer(TimerConfig& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  // Value and mode registers are adjacent
  uint8_t buf[2] = {0};
  Status st = readRegs(cmd::REG_TIMER_VALUE, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  const uint8_t mode = buf[1];
  out.value = buf[0];
  out.frequency = static_cast<TimerFrequency>((mode & cmd::TIMER_TCF_MASK) >> cmd::TIMER_TCF_SHIFT);
  out.enabled = ((mode & (1u << cmd::TIMER_TE_BIT)) != 0);
  out.interruptEnabled = ((mode & (1u << cmd::TIMER_TIE_BIT)) != 0);
  out.pulsed = ((mode & (1u << cmd::TIMER_TI_TP_BIT)) != 0);
  return Status::Ok();
}

Status PCF85063A::readTimerFlag(bool& elapsed) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t control2 = 0;
  Status st = readRegs(cmd::REG_CONTROL2, &control2, 1);
  if (!st.ok()) {
    return st;
  }

  elapsed = ((control2 & (1u << cmd::CTRL2_TF_BIT)) != 0);
  return Status::Ok();
}

Status PCF85063A::clearTimerFlag() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return updateBits(cmd::REG_CONTROL2, static_cast<uint8_t>(1u << cmd::CTRL2_TF_BIT), 0);
}

// ===== Clock Output Operations =====

Status PCF85063A::setClkoutFrequency(ClkoutFrequency freq) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  const uint8_t freqRaw = static_cast<uint8_t>(freq);
  if (freqRaw > kMaxClkoutFrequency) {
    return Status::Error(Err::INVALID_PARAM, "CLKOUT frequency out of range");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return updateBits(cmd::REG_CONTROL2, cmd::CTRL2_COF_MASK, freqRaw);
}

Status PCF85063A::getClkoutFrequency(ClkoutFrequency& freq) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t control2 = 0;
  Status st = readRegs(cmd::REG_CONTROL2, &control2, 1);
  if (!st.ok()) {
    return st;
  }

  freq = static_cast<ClkoutFrequency>(control2 & cmd::CTRL2_COF_MASK);
  return Status::Ok();
}

// ===== Oscillator Operations =====

Status PCF85063A::setLoadCapacitance(LoadCapacitance cap) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (static_cast<uint8_t>(cap) > kMaxLoadCapacitance) {
    return Status::Error(Err::INVALID_PARAM, "Load capacitance out of range");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  const uint8_t capBit = static_cast<uint8_t>(1u << cmd::CTRL1_CAP_SEL_BIT);
  return updateBits(cmd::REG_CONTROL1, capBit, (cap == LoadCapacitance::Pf12_5) ? capBit : 0);
}

Status PCF85063A::getLoadCapacitance(LoadCapacitance& cap) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t control1 = 0;
  Status st = readRegs(cmd::REG_CONTROL1, &control1, 1);
  if (!st.ok()) {
    return st;
  }

  cap = ((control1 & (1u << cmd::CTRL1_CAP_SEL_BIT)) != 0) ? LoadCapacitance::Pf12_5
                                                           : LoadCapacitance::Pf7;
  return Status::Ok();
}

Status PCF85063A::setOffset(OffsetMode mode, int8_t value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (static_cast<uint8_t>(mode) > kMaxOffsetMode) {
    return Status::Error(Err::INVALID_PARAM, "Offset mode out of range");
  }
  if (value < kOffsetMin || value > kOffsetMax) {
    return Status::Error(Err::INVALID_PARAM, "Offset out of range");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  // MODE and the offset fill the whole register
  uint8_t raw = static_cast<uint8_t>(static_cast<uint8_t>(value) & cmd::OFFSET_VALUE_MASK);
  if (mode == OffsetMode::EveryFourMinutes) {
    raw = static_cast<uint8_t>(raw | (1u << cmd::OFFSET_MODE_BIT));
  }
  return writeRegs(cmd::REG_OFFSET, &raw, 1);
}

Status PCF85063A::getOffset(OffsetMode& mode, int8_t& value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t raw = 0;
  Status st = readRegs(cmd::REG_OFFSET, &raw, 1);
  if (!st.ok()) {
    return st;
  }

  mode = ((raw & (1u << cmd::OFFSET_MODE_BIT)) != 0) ? OffsetMode::EveryFourMinutes
                                                      : OffsetMode::EveryTwoHours;
  raw = static_cast<uint8_t>(raw & cmd::OFFSET_VALUE_MASK);
  // Sign-extend 7-bit two's complement
  value = (raw & 0x40) ? static_cast<int8_t>(raw | 0x80) : static_cast<int8_t>(raw);
  return Status::Ok();
}

// ===== RAM Byte =====

Status PCF85063A::readRamByte(uint8_t& value) {
  return readRegister(cmd::REG_RAM_BYTE, value);
}

Status PCF85063A::writeRamByte(uint8_t value) {
  return writeRegister(cmd::REG_RAM_BYTE, value);
}

// ===== Low-Level Operations =====

Status PCF85063A::readRegisters(uint8_t reg, uint8_t* buf, size_t len) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return readRegs(reg, buf, len);
}

Status PCF85063A::writeRegisters(uint8_t reg, const uint8_t* buf, size_t len) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return writeRegs(reg, buf, len);
}

Status PCF85063A::readRegister(uint8_t reg, uint8_t& value) {
  uint8_t buf = 0;
  Status st = readRegisters(reg, &buf, 1);
  if (st.ok()) {
    value = buf;
  }
  return st;
}

Status PCF85063A::writeRegister(uint8_t reg, uint8_t value) {
  return writeRegisters(reg, &value, 1);
}

Status PCF85063A::readRegisterBits(uint8_t reg, uint8_t mask, uint8_t& value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (mask == 0) {
    return Status::Error(Err::INVALID_PARAM, "Bit mask is empty");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }

  uint8_t current = 0;
  Status st = readRegs(reg, &current, 1);
  if (!st.ok()) {
    return st;
  }

  value = static_cast<uint8_t>((current & mask) >> fieldShift(mask));
  return Status::Ok();
}

Status PCF85063A::writeRegisterBits(uint8_t reg, uint8_t mask, uint8_t value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (mask == 0) {
    return Status::Error(Err::INVALID_PARAM, "Bit mask is empty");
  }

  const uint16_t shifted = static_cast<uint16_t>(static_cast<uint16_t>(value) << fieldShift(mask));
  if ((shifted & static_cast<uint16_t>(~static_cast<uint16_t>(mask))) != 0) {
    return Status::Error(Err::INVALID_PARAM, "Value does not fit bit mask");
  }

  BusGuard guard(_config);
  if (!guard.ok()) {
    return guard.status();
  }
  return updateBits(reg, mask, static_cast<uint8_t>(shifted));
}

// ===== Static Codec Functions =====

Status PCF85063A::encodeTime(const DateTime& time, uint8_t* regs) {
  if (regs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Time buffer is null");
  }
  if (!isValidDateTime(time)) {
    return Status::Error(Err::INVALID_DATETIME, "Invalid date/time values");
  }

  uint8_t month = binToBcd(time.month);
  if (time.year < 2000) {
    month = static_cast<uint8_t>(month | (1u << cmd::MONTHS_CENTURY_BIT));
  }

  regs[0] = binToBcd(time.second);  // OS bit clear
  regs[1] = binToBcd(time.minute);
  regs[2] = binToBcd(time.hour);
  regs[3] = binToBcd(time.day);
  regs[4] = static_cast<uint8_t>(time.weekday & cmd::WEEKDAYS_MASK);
  regs[5] = month;
  regs[6] = binToBcd(static_cast<uint8_t>(time.year % 100));
  return Status::Ok();
}

Status PCF85063A::decodeTime(const uint8_t* regs, DateTime& out, bool& oscillatorStopped) {
  if (regs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Time buffer is null");
  }

  oscillatorStopped = ((regs[0] & (1u << cmd::SECONDS_OS_BIT)) != 0);

  const uint8_t secReg = static_cast<uint8_t>(regs[0] & cmd::SECONDS_MASK);
  const uint8_t minReg = static_cast<uint8_t>(regs[1] & cmd::MINUTES_MASK);
  const uint8_t hourReg = static_cast<uint8_t>(regs[2] & cmd::HOURS_MASK);
  const uint8_t dayReg = static_cast<uint8_t>(regs[3] & cmd::DAYS_MASK);
  const uint8_t wdayReg = static_cast<uint8_t>(regs[4] & cmd::WEEKDAYS_MASK);
  const uint8_t monthReg = static_cast<uint8_t>(regs[5] & cmd::MONTHS_MASK);
  const uint8_t yearReg = regs[6];
  const bool century19 = ((regs[5] & (1u << cmd::MONTHS_CENTURY_BIT)) != 0);

  if (!isValidBcd(secReg) || !isValidBcd(minReg) || !isValidBcd(hourReg) ||
      !isValidBcd(dayReg) || !isValidBcd(monthReg) || !isValidBcd(yearReg)) {
    return Status::Error(Err::INVALID_DATETIME, "RTC returned invalid BCD");
  }

  DateTime decoded;
  decoded.second = bcdToBin(secReg);
  decoded.minute = bcdToBin(minReg);
  decoded.hour = bcdToBin(hourReg);
  decoded.day = bcdToBin(dayReg);
  decoded.weekday = wdayReg;
  decoded.month = bcdToBin(monthReg);
  decoded.year = static_cast<uint16_t>((century19 ? 1900 : 2000) + bcdToBin(yearReg));

  if (!isValidDateTime(decoded)) {
    return Status::Error(Err::INVALID_DATETIME, "RTC returned invalid date/time");
  }

  out = decoded;
  return Status::Ok();
}

Status PCF85063A::encodeAlarm(const AlarmSpec& alarm, uint8_t* regs) {
  if (regs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Alarm buffer is null");
  }

  uint8_t match = 0;
  bool found = false;
  for (size_t i = 0; i < kAlarmRowCount; ++i) {
    if (kAlarmRows[i].frequency == alarm.frequency) {
      match = kAlarmRows[i].match;
      found = true;
      break;
    }
  }
  if (!found) {
    return Status::Error(Err::INVALID_PARAM, "Alarm frequency cannot be written");
  }

  const DateTime& t = alarm.time;
  if (t.second > 59 ||
      ((match & kMatchMinute) && t.minute > 59) ||
      ((match & kMatchHour) && t.hour > 23) ||
      ((match & kMatchDay) && (t.day < 1 || t.day > 31)) ||
      ((match & kMatchWeekday) && t.weekday > 6)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid alarm time values");
  }

  regs[0] = binToBcd(t.second);
  regs[1] = (match & kMatchMinute) ? binToBcd(t.minute) : cmd::ALARM_DISABLE;
  regs[2] = (match & kMatchHour) ? binToBcd(t.hour) : cmd::ALARM_DISABLE;
  regs[3] = (match & kMatchDay) ? binToBcd(t.day) : cmd::ALARM_DISABLE;
  regs[4] = (match & kMatchWeekday) ? static_cast<uint8_t>(t.weekday & cmd::WEEKDAYS_MASK)
                                    : cmd::ALARM_DISABLE;
  return Status::Ok();
}

Status PCF85063A::decodeAlarm(const uint8_t* regs, AlarmSpec& out) {
  if (regs == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Alarm buffer is null");
  }

  uint8_t match = 0;
  for (uint8_t i = 0; i < cmd::ALARM_BLOCK_LEN; ++i) {
    if ((regs[i] & cmd::ALARM_DISABLE) == 0) {
      match = static_cast<uint8_t>(match | (1u << i));
    }
  }

  const uint8_t secRaw = static_cast<uint8_t>(regs[0] & cmd::SECONDS_MASK);
  const uint8_t minRaw = static_cast<uint8_t>(regs[1] & cmd::MINUTES_MASK);
  const uint8_t hourRaw = static_cast<uint8_t>(regs[2] & cmd::HOURS_MASK);
  const uint8_t dayRaw = static_cast<uint8_t>(regs[3] & cmd::DAYS_MASK);
  const uint8_t wdayRaw = static_cast<uint8_t>(regs[4] & cmd::WEEKDAYS_MASK);

  // Only enabled fields carry meaning; disabled ones may hold anything
  if (((match & kMatchSecond) && !isValidBcd(secRaw)) ||
      ((match & kMatchMinute) && !isValidBcd(minRaw)) ||
      ((match & kMatchHour) && !isValidBcd(hourRaw)) ||
      ((match & kMatchDay) && !isValidBcd(dayRaw))) {
    return Status::Error(Err::INVALID_PARAM, "Alarm registers contain invalid BCD");
  }

  AlarmSpec decoded;
  if (match & kMatchSecond) {
    decoded.time.second = bcdToBin(secRaw);
  }
  if (match & kMatchMinute) {
    decoded.time.minute = bcdToBin(minRaw);
  }
  if (match & kMatchHour) {
    decoded.time.hour = bcdToBin(hourRaw);
  }
  if (match & kMatchDay) {
    decoded.time.day = bcdToBin(dayRaw);
  }
  if (match & kMatchWeekday) {
    decoded.time.weekday = wdayRaw;
  }

  if (decoded.time.second > 59 || decoded.time.minute > 59 || decoded.time.hour > 23 ||
      decoded.time.day > 31 || decoded.time.weekday > 6 ||
      ((match & kMatchDay) && decoded.time.day == 0)) {
    return Status::Error(Err::INVALID_PARAM, "Alarm registers out of range");
  }

  decoded.frequency = AlarmFrequency::Custom;
  for (size_t i = 0; i < kAlarmRowCount; ++i) {
    if (kAlarmRows[i].match == match) {
      decoded.frequency = kAlarmRows[i].frequency;
      break;
    }
  }

  out = decoded;
  return Status::Ok();
}

// ===== Static Utility Functions =====

bool PCF85063A::isValidDateTime(const DateTime& time) {
  if (time.year < 1900 || time.year > 2099) {
    return false;
  }
  if (time.month < 1 || time.month > 12) {
    return false;
  }
  if (time.day < 1 || time.day > 31) {
    return false;
  }
  if (time.hour > 23 || time.minute > 59 || time.second > 59) {
    return false;
  }
  if (time.weekday > 6) {
    return false;
  }
  return true;
}

uint8_t PCF85063A::computeWeekday(uint16_t year, uint8_t month, uint8_t day) {
  // 1900-01-01 was a Monday
  return static_cast<uint8_t>((daysSince1900(year, month, day) + 1) % 7);
}

bool PCF85063A::parseBuildTime(DateTime& out) {
  const char* dateStr = __DATE__;
  const char* timeStr = __TIME__;
  if (!dateStr || !timeStr) {
    return false;
  }

  char monthStr[4] = {0};
  int day = 0;
  int year = 0;
  if (sscanf(dateStr, "%3s %d %d", monthStr, &day, &year) != 3) {
    return false;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (sscanf(timeStr, "%d:%d:%d", &hour, &minute, &second) != 3) {
    return false;
  }

  const char* months = "JanFebMarAprMayJunJulAugSepOctNovDec";
  const char* pos = strstr(months, monthStr);
  if (!pos) {
    return false;
  }

  const uint8_t month = static_cast<uint8_t>((pos - months) / 3 + 1);

  out.year = static_cast<uint16_t>(year);
  out.month = month;
  out.day = static_cast<uint8_t>(day);
  out.hour = static_cast<uint8_t>(hour);
  out.minute = static_cast<uint8_t>(minute);
  out.second = static_cast<uint8_t>(second);
  if (out.year < 1900 || out.year > 2099 || month < 1 || month > 12 ||
      out.day < 1 || out.day > daysInMonth(out.year, month)) {
    return false;
  }
  out.weekday = computeWeekday(out.year, out.month, out.day);

  return isValidDateTime(out);
}

bool PCF85063A::isValidBcd(uint8_t v) {
  uint8_t low = static_cast<uint8_t>(v & 0x0F);
  uint8_t high = static_cast<uint8_t>((v >> 4) & 0x0F);
  return (low <= 9) && (high <= 9);
}

bool PCF85063A::unixToDateTime(uint32_t ts, DateTime& out) {
  uint32_t days = ts / 86400UL;
  uint32_t rem = ts % 86400UL;

  uint16_t year = 1970;
  for (; year <= 2099; ++year) {
    uint16_t daysInYear = isLeapYear(year) ? 366 : 365;
    if (days < daysInYear) {
      break;
    }
    days -= daysInYear;
  }
  if (year > 2099) {
    return false;  // Out of RTC range
  }

  uint8_t month = 1;
  for (; month <= 12; ++month) {
    uint8_t dim = daysInMonth(year, month);
    if (days < dim) {
      break;
    }
    days -= dim;
  }
  if (month > 12) {
    return false;
  }

  out.year = year;
  out.month = month;
  out.day = static_cast<uint8_t>(days + 1);
  out.hour = static_cast<uint8_t>(rem / 3600UL);
  rem %= 3600UL;
  out.minute = static_cast<uint8_t>(rem / 60UL);
  out.second = static_cast<uint8_t>(rem % 60UL);
  out.weekday = computeWeekday(out.year, out.month, out.day);

  return true;
}

bool PCF85063A::dateTimeToUnix(const DateTime& time, uint32_t& out) {
  if (!isValidDateTime(time) || time.year < 1970 ||
      time.day > daysInMonth(time.year, time.month)) {
    return false;
  }
  uint32_t days = daysSince1900(time.year, time.month, time.day) - kDays1900To1970;
  out = days * 86400UL
      + static_cast<uint32_t>(time.hour) * 3600UL
      + static_cast<uint32_t>(time.minute) * 60UL
      + static_cast<uint32_t>(time.second);
  return true;
}

// ===== Private Helper Functions =====

Status PCF85063A::readRegs(uint8_t reg, uint8_t* buf, size_t len) {
  if (!_initialized && !_beginInProgress) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!buf || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C read parameters");
  }
  if (len > kMaxReadLen) {
    return Status::Error(Err::INVALID_PARAM, "I2C read length too large");
  }

  uint8_t tx = reg;
  return _config.i2cWriteRead(_config.i2cAddress, &tx, 1, buf, len,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status PCF85063A::writeRegs(uint8_t reg, const uint8_t* buf, size_t len) {
  if (!_initialized && !_beginInProgress) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!buf || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C write parameters");
  }

  // 1 byte for register address + 15 bytes data covers every register block
  static constexpr size_t kMaxWriteLen = 16;
  if (len > (kMaxWriteLen - 1)) {
    return Status::Error(Err::INVALID_PARAM, "I2C write length exceeds 15 bytes");
  }

  uint8_t tx[kMaxWriteLen] = {0};
  tx[0] = reg;
  std::memcpy(&tx[1], buf, len);
  return _config.i2cWrite(_config.i2cAddress, tx, len + 1,
                          _config.i2cTimeoutMs, _config.i2cUser);
}

Status PCF85063A::updateBits(uint8_t reg, uint8_t mask, uint8_t bits) {
  uint8_t current = 0;
  Status st = readRegs(reg, &current, 1);
  if (!st.ok()) {
    return st;
  }

  const uint8_t updated = static_cast<uint8_t>((current & static_cast<uint8_t>(~mask)) |
                                               (bits & mask));
  return writeRegs(reg, &updated, 1);
}

// ===== Conversion Helper Functions =====

uint8_t PCF85063A::bcdToBin(uint8_t v) {
  return static_cast<uint8_t>((v >> 4) * 10 + (v & 0x0F));
}

uint8_t PCF85063A::binToBcd(uint8_t v) {
  // v <= 99; callers range-check first
  return static_cast<uint8_t>(((v / 10) << 4) | (v % 10));
}

bool PCF85063A::isLeapYear(uint16_t year) {
  return (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));
}

uint8_t PCF85063A::daysInMonth(uint16_t year, uint8_t month) {
  static constexpr uint8_t kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 0 || month > 12) {
    return 0;
  }
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

uint32_t PCF85063A::daysSince1900(uint16_t year, uint8_t month, uint8_t day) {
  uint32_t days = 0;

  for (uint16_t y = 1900; y < year; ++y) {
    days += isLeapYear(y) ? 366 : 365;
  }

  static constexpr uint16_t kDaysBeforeMonth[] = {
    0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334
  };
  if (month >= 1 && month <= 12) {
    days += kDaysBeforeMonth[month - 1];
  }

  if (month > 2 && isLeapYear(year)) {
    days += 1;
  }

  if (day > 0) {
    days += static_cast<uint32_t>(day - 1);
  }

  return days;
}

}  // namespace PCF85063A
