#include <stddef.h>
#include <stdint.h>
#include <unity.h>

#include "FakeI2cBus.h"
#include "PCF85063A/CommandTable.h"
#include "PCF85063A/PCF85063A.h"

using fake::FakeI2cBus;
using fake::makeConfig;
using fake::makeLockedConfig;
using fake::resetBus;

namespace {

void assertCode(PCF85063A::Err expected, const PCF85063A::Status& st) {
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(expected), static_cast<uint8_t>(st.code));
}

}  // namespace

void setUp() {}
void tearDown() {}

void test_begin_rejects_invalid_config() {
  FakeI2cBus bus;
  resetBus(bus);
  PCF85063A::PCF85063A rtc;

  PCF85063A::Config cfg = makeConfig(bus);
  cfg.i2cAddress = 0x52;
  assertCode(PCF85063A::Err::INVALID_CONFIG, rtc.begin(cfg));

  cfg = makeConfig(bus);
  cfg.i2cWrite = nullptr;
  assertCode(PCF85063A::Err::INVALID_CONFIG, rtc.begin(cfg));

  cfg = makeConfig(bus);
  cfg.i2cTimeoutMs = 0;
  assertCode(PCF85063A::Err::INVALID_CONFIG, rtc.begin(cfg));

  cfg = makeConfig(bus);
  cfg.busLock = fake::fakeBusLock;
  assertCode(PCF85063A::Err::INVALID_CONFIG, rtc.begin(cfg));

  TEST_ASSERT_FALSE(rtc.isInitialized());
  TEST_ASSERT_EQUAL_UINT32(0, bus.reads);
}

void test_begin_reports_missing_device() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.failNextRead = true;

  PCF85063A::PCF85063A rtc;
  PCF85063A::Status st = rtc.begin(makeConfig(bus));
  assertCode(PCF85063A::Err::DEVICE_NOT_FOUND, st);
  TEST_ASSERT_EQUAL_INT32(-3, st.detail);
  TEST_ASSERT_FALSE(rtc.isInitialized());
}

void test_operations_require_begin() {
  PCF85063A::PCF85063A rtc;
  PCF85063A::DateTime dt;
  bool flag = false;
  uint8_t value = 0;

  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.readTime(dt, flag));
  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.readAlarmFlag(flag));
  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.writeAlarmFlag(true));
  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.readRegister(0x00, value));
  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.probe());

  FakeI2cBus bus;
  resetBus(bus);
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  TEST_ASSERT_TRUE(rtc.isInitialized());
  rtc.end();
  TEST_ASSERT_FALSE(rtc.isInitialized());
  assertCode(PCF85063A::Err::NOT_INITIALIZED, rtc.readRegister(0x00, value));
}

void test_begin_applies_load_capacitance() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.regs[PCF85063A::cmd::REG_CONTROL1] = 0x04;

  PCF85063A::Config cfg = makeConfig(bus);
  cfg.applyCapacitance = true;
  cfg.capacitance = PCF85063A::LoadCapacitance::Pf12_5;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(cfg).ok());
  TEST_ASSERT_EQUAL_HEX8(0x05, bus.regs[PCF85063A::cmd::REG_CONTROL1]);

  PCF85063A::LoadCapacitance cap = PCF85063A::LoadCapacitance::Pf7;
  TEST_ASSERT_TRUE(rtc.getLoadCapacitance(cap).ok());
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(PCF85063A::LoadCapacitance::Pf12_5),
                          static_cast<uint8_t>(cap));

  TEST_ASSERT_TRUE(rtc.setLoadCapacitance(PCF85063A::LoadCapacitance::Pf7).ok());
  TEST_ASSERT_EQUAL_HEX8(0x04, bus.regs[PCF85063A::cmd::REG_CONTROL1]);
}

void test_register_read_write() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  fake::clearCounters(bus);

  const uint8_t data[] = {0x11, 0x22, 0x33};
  PCF85063A::Status st = rtc.writeRegisters(PCF85063A::cmd::REG_ALARM_SECOND, data, sizeof(data));
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_UINT32(1, bus.writes);

  uint8_t out[3] = {0};
  st = rtc.readRegisters(PCF85063A::cmd::REG_ALARM_SECOND, out, sizeof(out));
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_UINT32(1, bus.reads);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(data, out, sizeof(data));

  uint8_t big[33] = {0};
  assertCode(PCF85063A::Err::INVALID_PARAM, rtc.readRegisters(0x00, big, sizeof(big)));
  assertCode(PCF85063A::Err::INVALID_PARAM, rtc.readRegisters(0x00, big, 0));
  assertCode(PCF85063A::Err::INVALID_PARAM, rtc.writeRegisters(0x00, big, 16));
}

void test_ram_byte() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());

  TEST_ASSERT_TRUE(rtc.writeRamByte(0xA5).ok());
  TEST_ASSERT_EQUAL_HEX8(0xA5, bus.regs[PCF85063A::cmd::REG_RAM_BYTE]);

  uint8_t value = 0;
  TEST_ASSERT_TRUE(rtc.readRamByte(value).ok());
  TEST_ASSERT_EQUAL_HEX8(0xA5, value);
}

void test_masked_write_preserves_other_bits() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.regs[PCF85063A::cmd::REG_CONTROL1] = 0xA6;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  fake::clearCounters(bus);

  PCF85063A::Status st = rtc.writeRegisterBits(PCF85063A::cmd::REG_CONTROL1, 0x01, 1);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0xA7, bus.regs[PCF85063A::cmd::REG_CONTROL1]);
  TEST_ASSERT_EQUAL_UINT32(1, bus.reads);
  TEST_ASSERT_EQUAL_UINT32(1, bus.writes);

  // Multi-bit field in the middle of the register
  st = rtc.writeRegisterBits(PCF85063A::cmd::REG_CONTROL1, 0x30, 0x1);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0x97, bus.regs[PCF85063A::cmd::REG_CONTROL1]);

  uint8_t field = 0;
  st = rtc.readRegisterBits(PCF85063A::cmd::REG_CONTROL1, 0x30, field);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0x01, field);
}

void test_masked_write_rejects_bad_arguments() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  fake::clearCounters(bus);

  assertCode(PCF85063A::Err::INVALID_PARAM,
             rtc.writeRegisterBits(PCF85063A::cmd::REG_CONTROL1, 0x00, 0));
  assertCode(PCF85063A::Err::INVALID_PARAM,
             rtc.writeRegisterBits(PCF85063A::cmd::REG_CONTROL1, 0x06, 0x4));
  TEST_ASSERT_EQUAL_UINT32(0, bus.reads);
  TEST_ASSERT_EQUAL_UINT32(0, bus.writes);
}

void test_transport_errors_propagate_without_retry() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.regs[PCF85063A::cmd::REG_CONTROL2] = 0x40;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  fake::clearCounters(bus);

  bus.failNextRead = true;
  bool triggered = false;
  PCF85063A::Status st = rtc.readAlarmFlag(triggered);
  assertCode(PCF85063A::Err::I2C_ERROR, st);
  TEST_ASSERT_EQUAL_INT32(-3, st.detail);
  TEST_ASSERT_EQUAL_UINT32(1, bus.reads);

  bus.timeoutNextRead = true;
  PCF85063A::DateTime dt;
  bool stopped = false;
  st = rtc.readTime(dt, stopped);
  assertCode(PCF85063A::Err::TIMEOUT, st);
  TEST_ASSERT_TRUE(st.isTransportError());

  // Failed read in a masked update skips the write
  fake::clearCounters(bus);
  bus.failNextRead = true;
  st = rtc.clearAlarmFlag();
  assertCode(PCF85063A::Err::I2C_ERROR, st);
  TEST_ASSERT_EQUAL_UINT32(0, bus.writes);
  TEST_ASSERT_EQUAL_HEX8(0x40, bus.regs[PCF85063A::cmd::REG_CONTROL2]);

  fake::clearCounters(bus);
  bus.failNextWrite = true;
  PCF85063A::DateTime now;
  now.year = 2024;
  now.month = 1;
  now.day = 1;
  st = rtc.setTime(now);
  assertCode(PCF85063A::Err::I2C_ERROR, st);
  TEST_ASSERT_EQUAL_UINT32(1, bus.writes);
}

void test_bus_lock_held_per_operation() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeLockedConfig(bus)).ok());
  TEST_ASSERT_EQUAL_UINT32(1, bus.locks);
  TEST_ASSERT_EQUAL_UINT32(1, bus.unlocks);

  // Masked update: one lock around read and write
  TEST_ASSERT_TRUE(rtc.setAlarmInterrupt(true).ok());
  TEST_ASSERT_EQUAL_UINT32(2, bus.locks);
  TEST_ASSERT_EQUAL_UINT32(2, bus.unlocks);

  // Released on failure too
  bus.failNextRead = true;
  bool triggered = false;
  assertCode(PCF85063A::Err::I2C_ERROR, rtc.readAlarmFlag(triggered));
  TEST_ASSERT_EQUAL_UINT32(3, bus.locks);
  TEST_ASSERT_EQUAL_UINT32(3, bus.unlocks);
  TEST_ASSERT_FALSE(bus.locked);
  TEST_ASSERT_FALSE(bus.accessWithoutLock);

  // Validation failures never take the lock
  PCF85063A::DateTime bad;
  assertCode(PCF85063A::Err::INVALID_DATETIME, rtc.setTime(bad));
  TEST_ASSERT_EQUAL_UINT32(3, bus.locks);
}

void test_bus_lock_timeout_reports_busy() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::Config cfg = makeLockedConfig(bus);
  cfg.lockTimeoutMs = 250;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(cfg).ok());
  fake::clearCounters(bus);

  bus.lockAvailable = false;
  bool triggered = false;
  PCF85063A::Status st = rtc.readAlarmFlag(triggered);
  assertCode(PCF85063A::Err::BUS_BUSY, st);
  // Lock callback detail (time waited) is kept for diagnosis
  TEST_ASSERT_EQUAL_INT32(250, st.detail);
  TEST_ASSERT_EQUAL_UINT32(0, bus.reads);
  TEST_ASSERT_EQUAL_UINT32(1, bus.unlocks);
}

void test_clkout_frequency_preserves_flags() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.regs[PCF85063A::cmd::REG_CONTROL2] = 0xC8;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());

  PCF85063A::Status st = rtc.setClkoutFrequency(PCF85063A::ClkoutFrequency::Hz1);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0xCE, bus.regs[PCF85063A::cmd::REG_CONTROL2]);

  PCF85063A::ClkoutFrequency freq = PCF85063A::ClkoutFrequency::Hz32768;
  st = rtc.getClkoutFrequency(freq);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(PCF85063A::ClkoutFrequency::Hz1),
                          static_cast<uint8_t>(freq));

  st = rtc.setClkoutFrequency(static_cast<PCF85063A::ClkoutFrequency>(8));
  assertCode(PCF85063A::Err::INVALID_PARAM, st);
}

void test_timer_config_and_flag() {
  FakeI2cBus bus;
  resetBus(bus);
  bus.regs[PCF85063A::cmd::REG_TIMER_MODE] = 0x18 | 0x04 | 0x20;

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());
  fake::clearCounters(bus);

  PCF85063A::TimerConfig cfg;
  cfg.value = 10;
  cfg.frequency = PCF85063A::TimerFrequency::Hz1;
  cfg.enabled = true;
  cfg.interruptEnabled = true;
  cfg.pulsed = false;
  PCF85063A::Status st = rtc.setTimer(cfg);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(10, bus.regs[PCF85063A::cmd::REG_TIMER_VALUE]);
  // Reserved high bits kept
  TEST_ASSERT_EQUAL_HEX8(0x20 | 0x10 | 0x04 | 0x02, bus.regs[PCF85063A::cmd::REG_TIMER_MODE]);
  TEST_ASSERT_EQUAL_UINT32(2, bus.reads);
  TEST_ASSERT_EQUAL_UINT32(3, bus.writes);

  PCF85063A::TimerConfig out;
  st = rtc.getTimer(out);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_UINT8(10, out.value);
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(PCF85063A::TimerFrequency::Hz1),
                          static_cast<uint8_t>(out.frequency));
  TEST_ASSERT_TRUE(out.enabled);
  TEST_ASSERT_TRUE(out.interruptEnabled);
  TEST_ASSERT_FALSE(out.pulsed);

  bus.regs[PCF85063A::cmd::REG_CONTROL2] = 0x48;
  bool elapsed = false;
  TEST_ASSERT_TRUE(rtc.readTimerFlag(elapsed).ok());
  TEST_ASSERT_TRUE(elapsed);
  TEST_ASSERT_TRUE(rtc.clearTimerFlag().ok());
  TEST_ASSERT_EQUAL_HEX8(0x40, bus.regs[PCF85063A::cmd::REG_CONTROL2]);

  cfg.frequency = static_cast<PCF85063A::TimerFrequency>(4);
  assertCode(PCF85063A::Err::INVALID_PARAM, rtc.setTimer(cfg));
}

void test_offset_register() {
  FakeI2cBus bus;
  resetBus(bus);

  PCF85063A::PCF85063A rtc;
  TEST_ASSERT_TRUE(rtc.begin(makeConfig(bus)).ok());

  PCF85063A::Status st = rtc.setOffset(PCF85063A::OffsetMode::EveryFourMinutes, -3);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0xFD, bus.regs[PCF85063A::cmd::REG_OFFSET]);

  PCF85063A::OffsetMode mode = PCF85063A::OffsetMode::EveryTwoHours;
  int8_t value = 0;
  st = rtc.getOffset(mode, value);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(PCF85063A::OffsetMode::EveryFourMinutes),
                          static_cast<uint8_t>(mode));
  TEST_ASSERT_EQUAL_INT8(-3, value);

  st = rtc.setOffset(PCF85063A::OffsetMode::EveryTwoHours, 63);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0x3F, bus.regs[PCF85063A::cmd::REG_OFFSET]);

  assertCode(PCF85063A::Err::INVALID_PARAM,
             rtc.setOffset(PCF85063A::OffsetMode::EveryTwoHours, 64));
  assertCode(PCF85063A::Err::INVALID_PARAM,
             rtc.setOffset(PCF85063A::OffsetMode::EveryTwoHours, -65));
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_begin_rejects_invalid_config);
  RUN_TEST(test_begin_reports_missing_device);
  RUN_TEST(test_operations_require_begin);
  RUN_TEST(test_begin_applies_load_capacitance);
  RUN_TEST(test_register_read_write);
  RUN_TEST(test_ram_byte);
  RUN_TEST(test_masked_write_preserves_other_bits);
  RUN_TEST(test_masked_write_rejects_bad_arguments);
  RUN_TEST(test_transport_errors_propagate_without_retry);
  RUN_TEST(test_bus_lock_held_per_operation);
  RUN_TEST(test_bus_lock_timeout_reports_busy);
  RUN_TEST(test_clkout_frequency_preserves_flags);
  RUN_TEST(test_timer_config_and_flag);
  RUN_TEST(test_offset_register);
  return UNITY_END();
}
