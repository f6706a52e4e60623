/**
 * Unit tests for the SH1107 I2C transport: control bytes, page chunking and failure propagation
 */

#include "DebugConfiguration.h"
#include "MockHardware.h"
#include "TestUtil.h"
#include "sh1107/interface/I2cInterface.h"
#include <unity.h>

using namespace sh1107;

typedef I2cInterface<MockI2cBus> TestInterface;

static MockHardware hw;

static std::vector<uint8_t> ramp(size_t len)
{
  std::vector<uint8_t> buf(len);
  for (size_t i = 0; i < len; i++)
    buf[i] = (uint8_t)i;
  return buf;
}

// Page select for page, then one data write of chunk bytes taken from data at offset
static void assertChunk(size_t eventIndex, uint8_t page, const std::vector<uint8_t> &data, size_t offset, size_t chunk)
{
  const MockEvent &select = hw.events[eventIndex];
  const uint8_t expectedSelect[] = {0x00, page, 0x00, 0x10};
  TEST_ASSERT_EQUAL(4, select.bytes.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expectedSelect, select.bytes.data(), 4);

  const MockEvent &write = hw.events[eventIndex + 1];
  TEST_ASSERT_EQUAL(chunk + 1, write.bytes.size());
  TEST_ASSERT_EQUAL_UINT8(0x40, write.bytes[0]);
  TEST_ASSERT_EQUAL_UINT8_ARRAY(data.data() + offset, write.bytes.data() + 1, chunk);
}

void setUp(void) { hw.reset(); }

void tearDown(void) {}

void test_init_does_not_touch_the_bus(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  TEST_ASSERT_TRUE(iface.init());
  TEST_ASSERT_EQUAL(0, hw.events.size());
}

void test_commands_are_prefixed_with_control_byte(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3D);
  const uint8_t cmds[] = {0x81, 0x50};
  TEST_ASSERT_TRUE(iface.sendCommands(cmds, sizeof(cmds)));

  TEST_ASSERT_EQUAL(1, hw.events.size());
  TEST_ASSERT_EQUAL_UINT8(0x3D, hw.events[0].address);
  const uint8_t expected[] = {0x00, 0x81, 0x50};
  TEST_ASSERT_EQUAL(3, hw.events[0].bytes.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, hw.events[0].bytes.data(), 3);
}

void test_command_send_uses_encoding(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  TEST_ASSERT_TRUE(Command::noop().send(iface));

  const uint8_t expected[] = {0x00, 0xE3};
  TEST_ASSERT_EQUAL(2, hw.events[0].bytes.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, hw.events[0].bytes.data(), 2);
}

void test_overlong_command_sequence_is_truncated(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  const uint8_t cmds[] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
  TEST_ASSERT_TRUE(iface.sendCommands(cmds, sizeof(cmds)));

  TEST_ASSERT_EQUAL(EncodedCommand::MAX_LEN + 1, hw.events[0].bytes.size());
  TEST_ASSERT_EQUAL_UINT8(7, hw.events[0].bytes[7]);
}

void test_empty_command_sequence_sends_control_byte_only(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  TEST_ASSERT_TRUE(iface.sendCommands(nullptr, 0));

  TEST_ASSERT_EQUAL(1, hw.events.size());
  TEST_ASSERT_EQUAL(1, hw.events[0].bytes.size());
  TEST_ASSERT_EQUAL_UINT8(0x00, hw.events[0].bytes[0]);
}

void test_command_failure_is_comm_error(void)
{
  hw.failBusCall = 0;
  hw.busError = MockBusError::Timeout;
  TestInterface iface(MockI2cBus(&hw), 0x3C);

  auto r = Command::displayOn(true).send(iface);
  TEST_ASSERT_FALSE(r);
  TEST_ASSERT_TRUE(r.error().isComm());
  TEST_ASSERT_EQUAL(MockBusError::Timeout, r.error().commError());
  TEST_ASSERT_EQUAL(0, hw.events.size());
}

void test_empty_data_writes_nothing(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  uint8_t unused = 0;
  TEST_ASSERT_TRUE(iface.sendData(&unused, 0));
  TEST_ASSERT_EQUAL(0, hw.events.size());
}

void test_one_full_chunk(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(64);
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));

  TEST_ASSERT_EQUAL(2, hw.events.size());
  assertChunk(0, 0, data, 0, 64);
}

void test_short_buffer_is_one_short_chunk(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(5);
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));

  TEST_ASSERT_EQUAL(2, hw.events.size());
  assertChunk(0, 0, data, 0, 5);
}

void test_chunks_advance_one_page_each(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(130);
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));

  TEST_ASSERT_EQUAL(6, hw.events.size());
  assertChunk(0, 0, data, 0, 64);
  assertChunk(2, 1, data, 64, 64);
  assertChunk(4, 2, data, 128, 2);
  for (auto &e : hw.events)
    TEST_ASSERT_EQUAL_UINT8(0x3C, e.address);
}

void test_page_counter_restarts_every_call(void)
{
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(128);
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));

  TEST_ASSERT_EQUAL(8, hw.events.size());
  assertChunk(4, 0, data, 0, 64);
  assertChunk(6, 1, data, 64, 64);
}

void test_page_byte_counts_past_last_page(void)
{
  // A full 128x128 frame is 32 chunks, the page byte keeps counting past 15
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(2048);
  TEST_ASSERT_TRUE(iface.sendData(data.data(), data.size()));

  TEST_ASSERT_EQUAL(64, hw.events.size());
  assertChunk(30, 15, data, 15 * 64, 64);
  assertChunk(32, 16, data, 16 * 64, 64);
  assertChunk(62, 31, data, 31 * 64, 64);
}

void test_failure_on_second_chunk_stops(void)
{
  // calls: 0 select p0, 1 data p0, 2 select p1
  hw.failBusCall = 2;
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(130);

  auto r = iface.sendData(data.data(), data.size());
  TEST_ASSERT_FALSE(r);
  TEST_ASSERT_EQUAL(TestInterface::Error::Comm, r.error().kind());
  TEST_ASSERT_EQUAL(MockBusError::Nack, r.error().commError());

  TEST_ASSERT_EQUAL(2, hw.events.size());
  assertChunk(0, 0, data, 0, 64);
  TEST_ASSERT_EQUAL(3, hw.busCalls);
}

void test_failure_on_data_write_stops(void)
{
  hw.failBusCall = 1;
  TestInterface iface(MockI2cBus(&hw), 0x3C);
  std::vector<uint8_t> data = ramp(100);

  TEST_ASSERT_FALSE(iface.sendData(data.data(), data.size()));
  TEST_ASSERT_EQUAL(1, hw.events.size());
  TEST_ASSERT_EQUAL(2, hw.busCalls);
}

void setup()
{
  initializeTestEnvironment();
  UNITY_BEGIN();

  RUN_TEST(test_init_does_not_touch_the_bus);
  RUN_TEST(test_commands_are_prefixed_with_control_byte);
  RUN_TEST(test_command_send_uses_encoding);
  RUN_TEST(test_overlong_command_sequence_is_truncated);
  RUN_TEST(test_empty_command_sequence_sends_control_byte_only);
  RUN_TEST(test_command_failure_is_comm_error);
  RUN_TEST(test_empty_data_writes_nothing);
  RUN_TEST(test_one_full_chunk);
  RUN_TEST(test_short_buffer_is_one_short_chunk);
  RUN_TEST(test_chunks_advance_one_page_each);
  RUN_TEST(test_page_counter_restarts_every_call);
  RUN_TEST(test_page_byte_counts_past_last_page);
  RUN_TEST(test_failure_on_second_chunk_stops);
  RUN_TEST(test_failure_on_data_write_stops);

  exit(UNITY_END());
}

void loop() {}
