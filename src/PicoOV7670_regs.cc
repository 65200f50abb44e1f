#include "PicoOV7670_regs.h"


// manual output format, RGB565 with full 0-255 output range
const sensor_reg ov7670_rgb565_regs[] = {
	{ OV7670_REG_COM7, OV7670_COM7_RGB },
	{ OV7670_REG_RGB444, 0x00 },	// RGB444 off
	{ OV7670_REG_COM15, OV7670_COM15_RGB565 | OV7670_COM15_R00FF },
};
const size_t ov7670_rgb565_regs_count = sizeof(ov7670_rgb565_regs) / sizeof(sensor_reg);

// manual output format, YUV with full output range
const sensor_reg ov7670_yuv_regs[] = {
	{ OV7670_REG_COM7, OV7670_COM7_YUV },
	{ OV7670_REG_COM15, OV7670_COM15_R00FF },
};
const size_t ov7670_yuv_regs_count = sizeof(ov7670_yuv_regs) / sizeof(sensor_reg);

// baseline configuration, written once after reset
const sensor_reg ov7670_init_regs[] = {
	{ OV7670_REG_TSLB, OV7670_TSLB_YLAST },	// no auto window
	{ OV7670_REG_COM10, OV7670_COM10_VS_NEG },	// -VSYNC
	{ OV7670_REG_SLOP, 0x20 },
	{ OV7670_REG_GAM_BASE, 0x1C },
	{ OV7670_REG_GAM_BASE + 1, 0x28 },
	{ OV7670_REG_GAM_BASE + 2, 0x3C },
	{ OV7670_REG_GAM_BASE + 3, 0x55 },
	{ OV7670_REG_GAM_BASE + 4, 0x68 },
	{ OV7670_REG_GAM_BASE + 5, 0x76 },
	{ OV7670_REG_GAM_BASE + 6, 0x80 },
	{ OV7670_REG_GAM_BASE + 7, 0x88 },
	{ OV7670_REG_GAM_BASE + 8, 0x8F },
	{ OV7670_REG_GAM_BASE + 9, 0x96 },
	{ OV7670_REG_GAM_BASE + 10, 0xA3 },
	{ OV7670_REG_GAM_BASE + 11, 0xAF },
	{ OV7670_REG_GAM_BASE + 12, 0xC4 },
	{ OV7670_REG_GAM_BASE + 13, 0xD7 },
	{ OV7670_REG_GAM_BASE + 14, 0xE8 },
	{ OV7670_REG_COM8, OV7670_COM8_FASTAEC | OV7670_COM8_AECSTEP | OV7670_COM8_BANDING },
	{ OV7670_REG_GAIN, 0x00 },
	{ OV7670_REG_AECH, 0x00 },
	{ OV7670_REG_COM4, 0x00 },
	{ OV7670_REG_COM9, 0x20 },	// max AGC value
	{ OV7670_REG_BD50MAX, 0x05 },
	{ OV7670_REG_BD60MAX, 0x07 },
	{ OV7670_REG_AEW, 0x75 },
	{ OV7670_REG_AEB, 0x63 },
	{ OV7670_REG_VPT, 0xA5 },
	{ OV7670_REG_HAECC1, 0x78 },
	{ OV7670_REG_HAECC2, 0x68 },
	{ 0xA1, 0x03 },	// ???
	{ OV7670_REG_HAECC3, 0xDF },	// histogram-based AEC/AGC setup
	{ OV7670_REG_HAECC4, 0xDF },
	{ OV7670_REG_HAECC5, 0xF0 },
	{ OV7670_REG_HAECC6, 0x90 },
	{ OV7670_REG_HAECC7, 0x94 },
	{ OV7670_REG_COM8, OV7670_COM8_FASTAEC | OV7670_COM8_AECSTEP | OV7670_COM8_BANDING |
		OV7670_COM8_AGC | OV7670_COM8_AEC },
	{ OV7670_REG_COM5, 0x61 },
	{ OV7670_REG_COM6, 0x4B },
	{ 0x16, 0x02 },	// ???
	{ OV7670_REG_MVFP, 0x07 },
	{ OV7670_REG_ADCCTR1, 0x02 },
	{ OV7670_REG_ADCCTR2, 0x91 },
	{ 0x29, 0x07 },	// ???
	{ OV7670_REG_CHLF, 0x0B },
	{ 0x35, 0x0B },	// ???
	{ OV7670_REG_ADC, 0x1D },
	{ OV7670_REG_ACOM, 0x71 },
	{ OV7670_REG_OFON, 0x2A },
	{ OV7670_REG_COM12, 0x78 },
	{ 0x4D, 0x40 },	// ???
	{ 0x4E, 0x20 },	// ???
	{ OV7670_REG_GFIX, 0x5D },
	{ OV7670_REG_REG74, 0x19 },
	{ 0x8D, 0x4F },	// ???
	{ 0x8E, 0x00 },	// ???
	{ 0x8F, 0x00 },	// ???
	{ 0x90, 0x00 },	// ???
	{ 0x91, 0x00 },	// ???
	{ OV7670_REG_DM_LNL, 0x00 },
	{ 0x96, 0x00 },	// ???
	{ 0x9A, 0x80 },	// ???
	{ 0xB0, 0x84 },	// ???
	{ OV7670_REG_ABLC1, 0x0C },
	{ 0xB2, 0x0E },	// ???
	{ OV7670_REG_THL_ST, 0x82 },
	{ 0xB8, 0x0A },	// ???
	{ OV7670_REG_AWBC1, 0x14 },
	{ OV7670_REG_AWBC2, 0xF0 },
	{ OV7670_REG_AWBC3, 0x34 },
	{ OV7670_REG_AWBC4, 0x58 },
	{ OV7670_REG_AWBC5, 0x28 },
	{ OV7670_REG_AWBC6, 0x3A },
	{ 0x59, 0x88 },	// ???
	{ 0x5A, 0x88 },	// ???
	{ 0x5B, 0x44 },	// ???
	{ 0x5C, 0x67 },	// ???
	{ 0x5D, 0x49 },	// ???
	{ 0x5E, 0x0E },	// ???
	{ OV7670_REG_LCC3, 0x04 },
	{ OV7670_REG_LCC4, 0x20 },
	{ OV7670_REG_LCC5, 0x05 },
	{ OV7670_REG_LCC6, 0x04 },
	{ OV7670_REG_LCC7, 0x08 },
	{ OV7670_REG_AWBCTR3, 0x0A },
	{ OV7670_REG_AWBCTR2, 0x55 },
	{ OV7670_REG_MTX1, 0x80 },
	{ OV7670_REG_MTX2, 0x80 },
	{ OV7670_REG_MTX3, 0x00 },
	{ OV7670_REG_MTX4, 0x22 },
	{ OV7670_REG_MTX5, 0x5E },
	{ OV7670_REG_MTX6, 0x80 },	// 0x40?
	{ OV7670_REG_AWBCTR1, 0x11 },
	{ OV7670_REG_AWBCTR0, 0x9F },	// or 0x9E for advanced AWB
	{ OV7670_REG_BRIGHT, 0x00 },
	{ OV7670_REG_CONTRAS, 0x40 },
	{ OV7670_REG_CONTRAS_CENTER, 0x80 },	// 0x40?
};
const size_t ov7670_init_regs_count = sizeof(ov7670_init_regs) / sizeof(sensor_reg);

const sensor_window ov7670_window[5] = {
	// vstart, hstart, edge_offset, pclk_delay
	{ 9, 162, 2, 2 },	// DIV1  640x480 VGA
	{ 10, 174, 0, 2 },	// DIV2  320x240 QVGA
	{ 11, 186, 2, 2 },	// DIV4  160x120 QQVGA
	{ 12, 210, 0, 2 },	// DIV8  80x60
	{ 15, 252, 3, 2 },	// DIV16 40x30
};
