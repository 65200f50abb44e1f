#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "PicoOV7670_sensor.h"
#include "fake_port.h"


TEST(PicoOV7670Sensor, SoftResetWithoutResetLine)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	ASSERT_EQ(sensor.begin(&port, config), 1);
	EXPECT_TRUE(sensor.is_ready());

	ASSERT_FALSE(port.writes.empty());
	EXPECT_EQ(port.writes[0].first, OV7670_REG_COM7);
	EXPECT_EQ(port.writes[0].second, OV7670_COM7_RESET);
	EXPECT_EQ(port.events[0], "write " + std::to_string(OV7670_REG_COM7));
}

TEST(PicoOV7670Sensor, PowerSequenceWithShutdownAndResetLines)
{
	FakePort port;
	port.shutdown_wired = true;
	port.reset_wired = true;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	ASSERT_EQ(sensor.begin(&port, config), 1);

	const std::vector<std::string> expected = {
		"shutdown 1", "sleep 1", "shutdown 0", "sleep 300",
		"reset 0", "sleep 1", "reset 1", "sleep 1",
	};
	ASSERT_GE(port.events.size(), expected.size());
	for (size_t i = 0; i < expected.size(); i++)
		EXPECT_EQ(port.events[i], expected[i]) << "event " << i;

	// the reset line replaces the soft reset
	EXPECT_EQ(port.writes_to(OV7670_REG_COM7), 1);
	EXPECT_NE(port.writes[0].first, OV7670_REG_COM7);
}

TEST(PicoOV7670Sensor, BaselineTableWrittenInOrder)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	ASSERT_EQ(sensor.begin(&port, config), 1);

	// soft reset, then the baseline table, then the RGB565 patch list
	ASSERT_GE(port.writes.size(), 1 + ov7670_init_regs_count + ov7670_rgb565_regs_count);
	for (size_t i = 0; i < ov7670_init_regs_count; i++) {
		EXPECT_EQ(port.writes[1 + i].first, ov7670_init_regs[i].reg) << "entry " << i;
		EXPECT_EQ(port.writes[1 + i].second, ov7670_init_regs[i].val) << "entry " << i;
	}
	for (size_t i = 0; i < ov7670_rgb565_regs_count; i++) {
		const size_t n = 1 + ov7670_init_regs_count + i;
		EXPECT_EQ(port.writes[n].first, ov7670_rgb565_regs[i].reg);
		EXPECT_EQ(port.writes[n].second, ov7670_rgb565_regs[i].val);
	}

	// one 1 ms pause per table entry plus the one after the reset
	EXPECT_GE(port.total_sleep_ms, 1 + ov7670_init_regs_count + ov7670_rgb565_regs_count);
}

TEST(PicoOV7670Sensor, BaselineValues)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	ASSERT_EQ(sensor.begin(&port, config), 1);

	EXPECT_EQ(port.regs[OV7670_REG_TSLB], OV7670_TSLB_YLAST);
	EXPECT_EQ(port.regs[OV7670_REG_COM10], OV7670_COM10_VS_NEG);
	EXPECT_EQ(port.regs[OV7670_REG_COM8], 0xE5);
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0x07);
	EXPECT_EQ(port.regs[OV7670_REG_MTX6], 0x80);
	EXPECT_EQ(port.regs[OV7670_REG_CONTRAS_CENTER], 0x80);
	EXPECT_EQ(port.regs[OV7670_REG_GAM_BASE + 14], 0xE8);
}

TEST(PicoOV7670Sensor, DefaultSettings)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	ASSERT_EQ(sensor.begin(&port, config), 1);

	EXPECT_EQ(sensor.get_colorspace(), OV7670_COLOR_RGB);
	EXPECT_EQ(sensor.get_size(), OV7670_SIZE_DIV8);
	EXPECT_EQ(sensor.get_width(), 80);
	EXPECT_EQ(sensor.get_height(), 60);
	EXPECT_EQ(sensor.get_test_pattern(), OV7670_TEST_PATTERN_NONE);
	EXPECT_FALSE(sensor.get_flip_x());
	EXPECT_FALSE(sensor.get_flip_y());
	EXPECT_EQ(sensor.get_night(), OV7670_NIGHT_MODE_OFF);

	EXPECT_EQ(port.regs[OV7670_REG_SCALING_XSC], 0x20);
	EXPECT_EQ(port.regs[OV7670_REG_SCALING_YSC], 0x20);
	// flip and night match the baseline, so they aren't written
	EXPECT_EQ(port.writes_to(OV7670_REG_COM11), 0);
	EXPECT_EQ(port.writes_to(OV7670_REG_MVFP), 1);
}

TEST(PicoOV7670Sensor, ConfigAppliedByBegin)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	config.colorspace = OV7670_COLOR_YUV;
	config.size = OV7670_SIZE_DIV16;
	config.test_pattern = OV7670_TEST_PATTERN_COLOR_BAR;
	config.flip_y = true;
	config.night = OV7670_NIGHT_MODE_4;

	ASSERT_EQ(sensor.begin(&port, config), 1);

	EXPECT_EQ(sensor.get_colorspace(), OV7670_COLOR_YUV);
	EXPECT_EQ(sensor.get_size(), OV7670_SIZE_DIV16);
	EXPECT_EQ(sensor.get_test_pattern(), OV7670_TEST_PATTERN_COLOR_BAR);
	EXPECT_FALSE(sensor.get_flip_x());
	EXPECT_TRUE(sensor.get_flip_y());
	EXPECT_EQ(sensor.get_night(), OV7670_NIGHT_MODE_4);

	EXPECT_EQ(port.regs[OV7670_REG_COM7], OV7670_COM7_YUV);
	EXPECT_EQ(port.regs[OV7670_REG_SCALING_XSC], 0x40);
	EXPECT_EQ(port.regs[OV7670_REG_SCALING_YSC], 0xC0);
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0x17);
	EXPECT_EQ(port.regs[OV7670_REG_COM11], 0xC0 | 0x1A);
}

TEST(PicoOV7670Sensor, ColorspacePatchLists)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);
	port.clear_log();

	ASSERT_EQ(sensor.set_colorspace(OV7670_COLOR_YUV), 1);
	ASSERT_EQ(port.writes.size(), 2u);
	EXPECT_EQ(port.regs[OV7670_REG_COM7], 0x00);
	EXPECT_EQ(port.regs[OV7670_REG_COM15], 0xC0);
	EXPECT_TRUE(port.reads.empty());

	port.clear_log();
	ASSERT_EQ(sensor.set_colorspace(OV7670_COLOR_RGB), 1);
	ASSERT_EQ(port.writes.size(), 3u);
	EXPECT_EQ(port.regs[OV7670_REG_COM7], 0x04);
	EXPECT_EQ(port.regs[OV7670_REG_RGB444], 0x00);
	EXPECT_EQ(port.regs[OV7670_REG_COM15], 0xD0);
	EXPECT_EQ(sensor.get_colorspace(), OV7670_COLOR_RGB);
}

TEST(PicoOV7670Sensor, MirrorChangesOneBit)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	const uint8_t before = port.regs[OV7670_REG_MVFP];
	ASSERT_EQ(sensor.set_flip(true, false), 1);
	const uint8_t after = port.regs[OV7670_REG_MVFP];

	EXPECT_EQ(before ^ after, OV7670_MVFP_MIRROR);
	EXPECT_TRUE(sensor.get_flip_x());
	EXPECT_FALSE(sensor.get_flip_y());
}

TEST(PicoOV7670Sensor, FlipIsOneReadModifyWrite)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);
	port.regs[OV7670_REG_MVFP] = 0xC5;
	port.clear_log();

	ASSERT_EQ(sensor.set_flip(true, true), 1);
	EXPECT_EQ(port.reads_of(OV7670_REG_MVFP), 1);
	EXPECT_EQ(port.writes_to(OV7670_REG_MVFP), 1);
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0xF5);

	ASSERT_EQ(sensor.set_flip(false, false), 1);
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0xC5);
}

TEST(PicoOV7670Sensor, SingleFlagSettersKeepTheOther)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	ASSERT_EQ(sensor.set_flip_y(true), 1);
	ASSERT_EQ(sensor.set_flip_x(true), 1);
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0x07 | OV7670_MVFP_MIRROR | OV7670_MVFP_VFLIP);

	ASSERT_EQ(sensor.set_flip_y(false), 1);
	EXPECT_TRUE(sensor.get_flip_x());
	EXPECT_FALSE(sensor.get_flip_y());
	EXPECT_EQ(port.regs[OV7670_REG_MVFP], 0x07 | OV7670_MVFP_MIRROR);
}

TEST(PicoOV7670Sensor, NightModeConfinedToTopBits)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	const PicoOV7670_night_mode modes[] = {
		OV7670_NIGHT_MODE_2, OV7670_NIGHT_MODE_4, OV7670_NIGHT_MODE_8, OV7670_NIGHT_MODE_OFF,
	};
	for (int i = 0; i < 4; i++) {
		const uint8_t before = port.regs[OV7670_REG_COM11];
		ASSERT_EQ(sensor.set_night(modes[i]), 1);
		const uint8_t after = port.regs[OV7670_REG_COM11];
		EXPECT_EQ(before & 0x1F, after & 0x1F);
		EXPECT_EQ(after & 0xE0, modes[i]);
		EXPECT_EQ(sensor.get_night(), modes[i]);
	}
}

TEST(PicoOV7670Sensor, IdentityRegisters)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	EXPECT_EQ(sensor.get_product_id(), 0x76);
	EXPECT_EQ(sensor.get_product_version(), 0x73);

	port.fail_after = port.transactions;
	EXPECT_EQ(sensor.get_product_id(), -1);
}

TEST(PicoOV7670Sensor, CaptureSmallestYuvFrame)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	config.size = OV7670_SIZE_DIV16;
	config.colorspace = OV7670_COLOR_YUV;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	std::vector<uint8_t> frame(2 * 40 * 30, 0xAA);
	ASSERT_EQ(sensor.get_frame_bytes(), frame.size());
	ASSERT_EQ(sensor.capture(frame.data()), 1);

	EXPECT_EQ(port.captures, 1);
	EXPECT_EQ(port.capture_dest, frame.data());
	EXPECT_EQ(port.capture_length, 2400u);
	EXPECT_EQ(frame[0], 0);
	EXPECT_EQ(frame[2399], 2399 & 0xFF);
}

TEST(PicoOV7670Sensor, CaptureFollowsSizeChanges)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	ASSERT_EQ(sensor.set_size(OV7670_SIZE_DIV4), 1);
	std::vector<uint8_t> frame(sensor.get_frame_bytes());
	ASSERT_EQ(sensor.capture(frame.data()), 1);
	EXPECT_EQ(port.capture_length, 2u * 160 * 120);
}

TEST(PicoOV7670Sensor, NothingWorksBeforeBegin)
{
	PicoOV7670_sensor sensor;
	uint8_t frame[4];

	EXPECT_FALSE(sensor.is_ready());
	EXPECT_EQ(sensor.set_size(OV7670_SIZE_DIV2), 0);
	EXPECT_EQ(sensor.set_colorspace(OV7670_COLOR_YUV), 0);
	EXPECT_EQ(sensor.set_test_pattern(OV7670_TEST_PATTERN_COLOR_BAR), 0);
	EXPECT_EQ(sensor.set_flip(true, true), 0);
	EXPECT_EQ(sensor.set_night(OV7670_NIGHT_MODE_2), 0);
	EXPECT_EQ(sensor.capture(frame), 0);
	EXPECT_EQ(sensor.get_product_id(), -1);
	EXPECT_EQ(sensor.write_register(OV7670_REG_COM7, 0), 0);

	EXPECT_EQ(sensor.get_size(), OV7670_SIZE_DIV8);
	EXPECT_EQ(sensor.get_colorspace(), OV7670_COLOR_RGB);
}

TEST(PicoOV7670Sensor, DeinitStopsEverything)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	sensor.deinit();
	port.clear_log();

	std::vector<uint8_t> frame(sensor.get_frame_bytes());
	EXPECT_FALSE(sensor.is_ready());
	EXPECT_EQ(sensor.capture(frame.data()), 0);
	EXPECT_EQ(sensor.set_size(OV7670_SIZE_DIV2), 0);
	EXPECT_TRUE(port.writes.empty());
	EXPECT_EQ(port.captures, 0);
}

TEST(PicoOV7670Sensor, BusFailureDuringBaselineFailsBegin)
{
	FakePort port;
	port.fail_after = 20;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;

	EXPECT_EQ(sensor.begin(&port, config), 0);
	EXPECT_FALSE(sensor.is_ready());

	// no retries: everything up to the failure went out exactly once
	EXPECT_EQ(port.writes.size(), 20u);
	for (size_t i = 1; i < port.writes.size(); i++)
		EXPECT_EQ(port.writes[i].first, ov7670_init_regs[i - 1].reg);

	std::vector<uint8_t> frame(sensor.get_frame_bytes());
	EXPECT_EQ(sensor.capture(frame.data()), 0);
}

TEST(PicoOV7670Sensor, FailedSetterKeepsCachedState)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	// let the first 5 geometry transactions through, then fail
	port.fail_after = port.transactions + 5;
	EXPECT_EQ(sensor.set_size(OV7670_SIZE_DIV2), 0);
	EXPECT_EQ(sensor.get_size(), OV7670_SIZE_DIV8);

	// the registers written before the failure stay written
	EXPECT_EQ(port.regs[OV7670_REG_COM14], 0x19);

	EXPECT_EQ(sensor.set_test_pattern(OV7670_TEST_PATTERN_COLOR_BAR), 0);
	EXPECT_EQ(sensor.get_test_pattern(), OV7670_TEST_PATTERN_NONE);
	EXPECT_EQ(sensor.set_flip(true, true), 0);
	EXPECT_FALSE(sensor.get_flip_x());
	EXPECT_EQ(sensor.set_night(OV7670_NIGHT_MODE_8), 0);
	EXPECT_EQ(sensor.get_night(), OV7670_NIGHT_MODE_OFF);

	// the bus comes back
	port.fail_after = -1;
	EXPECT_EQ(sensor.set_size(OV7670_SIZE_DIV2), 1);
	EXPECT_EQ(sensor.get_size(), OV7670_SIZE_DIV2);
}

TEST(PicoOV7670Sensor, RawRegisterAccess)
{
	FakePort port;
	PicoOV7670_sensor sensor;
	PicoOV7670_config config;
	ASSERT_EQ(sensor.begin(&port, config), 1);

	EXPECT_EQ(sensor.write_register(OV7670_REG_BRIGHT, 0x30), 1);
	EXPECT_EQ(sensor.read_register(OV7670_REG_BRIGHT), 0x30);
}
