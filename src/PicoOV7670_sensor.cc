#include "PicoOV7670_sensor.h"


int PicoOV7670_sensor::reset_sensor(void)
{
	// pulse the shutdown line, then give the sensor 300 ms to power up
	if (port->has_shutdown_pin()) {
		port->set_shutdown_pin(1);
		port->sleep_ms(1);
		port->set_shutdown_pin(0);
		port->sleep_ms(300);
	}

	// without a reset line, the registers can be reset over the bus
	if (port->has_reset_pin()) {
		port->set_reset_pin(0);
		port->sleep_ms(1);
		port->set_reset_pin(1);
	} else {
		if (port->write_reg(OV7670_REG_COM7, OV7670_COM7_RESET) == 0)
			return 0;
	}

	port->sleep_ms(1);
	return 1;
}

int PicoOV7670_sensor::regs_write(const sensor_reg *regs, size_t count)
{
	for (size_t i = 0; i < count; i++) {
		if (port->write_reg(regs[i].reg, regs[i].val) == 0)
			return 0;
		port->sleep_ms(1);
	}
	return 1;
}

int PicoOV7670_sensor::modify_reg(uint8_t reg, uint8_t mask, uint8_t bits)
{
	uint8_t value;

	if (port->read_reg(reg, &value) == 0)
		return 0;
	value = (value & ~mask) | (bits & mask);
	return port->write_reg(reg, value);
}

int PicoOV7670_sensor::frame_control(PicoOV7670_size size)
{
	const sensor_window &window = ov7670_window[size];
	uint8_t value;

	// enable downsampling if sub-VGA, and zoom if 1:16 scale
	value = size > OV7670_SIZE_DIV1 ? OV7670_COM3_DCWEN : 0;
	if (size == OV7670_SIZE_DIV16)
		value |= OV7670_COM3_SCALEEN;
	if (port->write_reg(OV7670_REG_COM3, value) == 0)
		return 0;

	// enable PCLK division if sub-VGA: 2, 4, 8, 16 = 0x19, 0x1A, 0x1B, 0x1C
	value = size > OV7670_SIZE_DIV1 ? 0x18 + size : 0;
	if (port->write_reg(OV7670_REG_COM14, value) == 0)
		return 0;

	// horizontal / vertical downsample ratio, 1:8 max. H and V are always
	// equal, one per nibble
	value = size <= OV7670_SIZE_DIV8 ? size : OV7670_SIZE_DIV8;
	if (port->write_reg(OV7670_REG_SCALING_DCWCTR, value * 0x11) == 0)
		return 0;

	// pixel clock divider if sub-VGA
	value = size > OV7670_SIZE_DIV1 ? 0xF0 + size : 0x08;
	if (port->write_reg(OV7670_REG_SCALING_PCLK_DIV, value) == 0)
		return 0;

	// 0.5 digital zoom at 1:16, the other sizes are downsample only. Bit 7
	// of both registers belongs to the test pattern
	value = size == OV7670_SIZE_DIV16 ? 0x40 : 0x20;
	if (modify_reg(OV7670_REG_SCALING_XSC, OV7670_SCALING_FACTOR_MASK, value) == 0)
		return 0;
	if (modify_reg(OV7670_REG_SCALING_YSC, OV7670_SCALING_FACTOR_MASK, value) == 0)
		return 0;

	// the window is scattered across multiple registers, the stops are
	// computed from the starts. The horizontal stop wraps around the
	// blanking period
	const int vstart = window.vstart;
	const int hstart = window.hstart;
	const int vstop = vstart + 480;
	const int hstop = (hstart + 640) % OV7670_HTOTAL;

	if (port->write_reg(OV7670_REG_HSTART, hstart >> 3) == 0)
		return 0;
	if (port->write_reg(OV7670_REG_HSTOP, hstop >> 3) == 0)
		return 0;
	value = (window.edge_offset << 6) | ((hstop & 0x07) << 3) | (hstart & 0x07);
	if (port->write_reg(OV7670_REG_HREF, value) == 0)
		return 0;

	if (port->write_reg(OV7670_REG_VSTART, vstart >> 2) == 0)
		return 0;
	if (port->write_reg(OV7670_REG_VSTOP, vstop >> 2) == 0)
		return 0;
	value = ((vstop & 0x03) << 2) | (vstart & 0x03);
	if (port->write_reg(OV7670_REG_VREF, value) == 0)
		return 0;

	return port->write_reg(OV7670_REG_SCALING_PCLK_DELAY, window.pclk_delay);
}


int PicoOV7670_sensor::begin(PicoOV7670_port *port, const PicoOV7670_config &config)
{
	this->port = port;

	state = STATE_RESETTING;
	if (reset_sensor() == 0)
		return 0;

	if (regs_write(ov7670_init_regs, ov7670_init_regs_count) == 0)
		return 0;
	state = STATE_BASELINE_LOADED;

	// the baseline leaves mirror, flip and night mode off
	flip_x = flip_y = false;
	night = OV7670_NIGHT_MODE_OFF;

	if (set_colorspace(config.colorspace) == 0)
		return 0;
	if (set_size(config.size) == 0)
		return 0;
	if (set_test_pattern(config.test_pattern) == 0)
		return 0;
	if ((config.flip_x || config.flip_y) && set_flip(config.flip_x, config.flip_y) == 0)
		return 0;
	if (config.night != OV7670_NIGHT_MODE_OFF && set_night(config.night) == 0)
		return 0;

	state = STATE_READY;
	return 1;
}

void PicoOV7670_sensor::deinit(void)
{
	port = NULL;
	state = STATE_UNINITIALIZED;
}

int PicoOV7670_sensor::capture(uint8_t *dest)
{
	if (state != STATE_READY)
		return 0;
	return port->capture_frame(dest, get_frame_bytes());
}

int PicoOV7670_sensor::set_colorspace(PicoOV7670_colorspace colorspace)
{
	if (!can_configure())
		return 0;

	int ret;
	if (colorspace == OV7670_COLOR_RGB)
		ret = regs_write(ov7670_rgb565_regs, ov7670_rgb565_regs_count);
	else
		ret = regs_write(ov7670_yuv_regs, ov7670_yuv_regs_count);
	if (ret == 0)
		return 0;

	this->colorspace = colorspace;
	return 1;
}

int PicoOV7670_sensor::set_size(PicoOV7670_size size)
{
	if (!can_configure())
		return 0;
	if (frame_control(size) == 0)
		return 0;
	this->size = size;
	return 1;
}

int PicoOV7670_sensor::set_test_pattern(PicoOV7670_test_pattern pattern)
{
	if (!can_configure())
		return 0;

	// pattern bit 0 goes to bit 7 of SCALING_XSC, bit 1 to bit 7 of
	// SCALING_YSC. The scaling bits are left alone
	const uint8_t xsc = (pattern & 1) ? OV7670_SCALING_TEST_PATTERN : 0;
	const uint8_t ysc = (pattern & 2) ? OV7670_SCALING_TEST_PATTERN : 0;
	if (modify_reg(OV7670_REG_SCALING_XSC, OV7670_SCALING_TEST_PATTERN, xsc) == 0)
		return 0;
	if (modify_reg(OV7670_REG_SCALING_YSC, OV7670_SCALING_TEST_PATTERN, ysc) == 0)
		return 0;

	test_pattern = pattern;
	return 1;
}

int PicoOV7670_sensor::set_flip(bool flip_x, bool flip_y)
{
	if (!can_configure())
		return 0;

	uint8_t bits = 0;
	if (flip_x)
		bits |= OV7670_MVFP_MIRROR;
	if (flip_y)
		bits |= OV7670_MVFP_VFLIP;
	if (modify_reg(OV7670_REG_MVFP, OV7670_MVFP_MIRROR | OV7670_MVFP_VFLIP, bits) == 0)
		return 0;

	this->flip_x = flip_x;
	this->flip_y = flip_y;
	return 1;
}

int PicoOV7670_sensor::set_night(PicoOV7670_night_mode mode)
{
	if (!can_configure())
		return 0;
	if (modify_reg(OV7670_REG_COM11, OV7670_COM11_NIGHT_MASK, mode) == 0)
		return 0;
	night = mode;
	return 1;
}

int PicoOV7670_sensor::get_product_id(void)
{
	return read_register(OV7670_REG_PID);
}

int PicoOV7670_sensor::get_product_version(void)
{
	return read_register(OV7670_REG_VER);
}

int PicoOV7670_sensor::read_register(uint8_t reg)
{
	uint8_t value;

	if (port == NULL || port->read_reg(reg, &value) == 0)
		return -1;
	return value;
}

int PicoOV7670_sensor::write_register(uint8_t reg, uint8_t value)
{
	if (port == NULL)
		return 0;
	return port->write_reg(reg, value);
}
