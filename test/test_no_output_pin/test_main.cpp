/**
 * Unit tests for the output pins: NoOutputPin, the stand-in for pins that are not wired, and ArduinoOutputPin
 */

#include "DebugConfiguration.h"
#include "MockHardware.h"
#include "TestUtil.h"
#include "sh1107/NoOutputPin.h"
#include "sh1107/hal/ArduinoOutputPin.h"
#include "sh1107/interface/SpiInterface.h"
#include <type_traits>
#include <unity.h>

using namespace sh1107;

static MockHardware hw;

void setUp(void) { hw.reset(); }

void tearDown(void) {}

void test_set_always_succeeds(void)
{
  NoOutputPin pin;
  for (int i = 0; i < 3; i++) {
    TEST_ASSERT_TRUE(pin.setLow());
    TEST_ASSERT_TRUE(pin.setHigh());
  }
}

void test_error_type_is_uninhabited(void)
{
  TEST_ASSERT_TRUE((std::is_same<NoOutputPin::Error, Infallible>::value));
  TEST_ASSERT_FALSE(std::is_default_constructible<Infallible>::value);
}

void test_spi_without_chip_select(void)
{
  SpiInterface<MockSpiBus, NoOutputPin, NoOutputPin> iface(MockSpiBus(&hw), NoOutputPin(), NoOutputPin());
  const uint8_t bytes[] = {0xAF, 0x00};

  TEST_ASSERT_TRUE(iface.init());
  TEST_ASSERT_TRUE(iface.sendCommands(bytes, 1));
  TEST_ASSERT_TRUE(iface.sendData(bytes, 2));

  // Only the stream writes reach the hardware
  TEST_ASSERT_EQUAL(2, hw.events.size());
  TEST_ASSERT_EQUAL(2, hw.count(MockEvent::BusWrite));
}

void test_spi_without_chip_select_still_reports_bus_errors(void)
{
  hw.failBusCall = 0;
  SpiInterface<MockSpiBus, NoOutputPin, NoOutputPin> iface(MockSpiBus(&hw), NoOutputPin(), NoOutputPin());
  const uint8_t bytes[] = {0xAF};

  auto r = iface.sendCommands(bytes, 1);
  TEST_ASSERT_FALSE(r);
  TEST_ASSERT_TRUE(r.error().isComm());
}

void test_arduino_pin_toggles_after_construction(void)
{
  // portduinoSetup() always creates at least GPIO 0, simulated unless the config binds it
  ArduinoOutputPin pin(0);
  TEST_ASSERT_EQUAL_UINT32(0, pin.pinNumber());

  for (int i = 0; i < 3; i++) {
    TEST_ASSERT_TRUE(pin.setHigh());
    TEST_ASSERT_TRUE(pin.setLow());
  }
}

void setup()
{
  initializeTestEnvironment();
  UNITY_BEGIN();

  RUN_TEST(test_set_always_succeeds);
  RUN_TEST(test_error_type_is_uninhabited);
  RUN_TEST(test_spi_without_chip_select);
  RUN_TEST(test_spi_without_chip_select_still_reports_bus_errors);
  RUN_TEST(test_arduino_pin_toggles_after_construction);

  exit(UNITY_END());
}

void loop() {}
