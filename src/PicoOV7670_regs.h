#ifndef PicoOV7670_regs_H
#define PicoOV7670_regs_H

#include <stdint.h>
#include <stddef.h>

// OV7670 register map. Register addresses are 8 bit, values are 8 bit.

static const uint8_t OV7670_ADDR = 0x21;	// default 7 bit SCCB address

static const uint8_t OV7670_PID = 0x76;		// expected product id
static const uint8_t OV7670_VER = 0x73;		// expected product version

static const uint8_t OV7670_REG_GAIN = 0x00;	// AGC gain bits 7:0 (9:8 in VREF)
static const uint8_t OV7670_REG_BLUE = 0x01;	// AWB blue channel gain
static const uint8_t OV7670_REG_RED = 0x02;	// AWB red channel gain
static const uint8_t OV7670_REG_VREF = 0x03;	// vert frame control bits
static const uint8_t OV7670_REG_COM1 = 0x04;	// common control 1
static const uint8_t OV7670_COM1_R656 = 0x40;	//   enable R656 format
static const uint8_t OV7670_REG_BAVE = 0x05;	// U/B average level
static const uint8_t OV7670_REG_GbAVE = 0x06;	// Y/Gb average level
static const uint8_t OV7670_REG_AECHH = 0x07;	// exposure value, AEC 15:10 bits
static const uint8_t OV7670_REG_RAVE = 0x08;	// V/R average level
static const uint8_t OV7670_REG_COM2 = 0x09;	// common control 2
static const uint8_t OV7670_COM2_SSLEEP = 0x10;	//   soft sleep mode
static const uint8_t OV7670_REG_PID = 0x0A;	// product id MSB (read-only)
static const uint8_t OV7670_REG_VER = 0x0B;	// product id LSB (read-only)
static const uint8_t OV7670_REG_COM3 = 0x0C;	// common control 3
static const uint8_t OV7670_COM3_SWAP = 0x40;	//   output data MSB/LSB swap
static const uint8_t OV7670_COM3_SCALEEN = 0x08;	//   scale enable
static const uint8_t OV7670_COM3_DCWEN = 0x04;	//   DCW enable
static const uint8_t OV7670_REG_COM4 = 0x0D;	// common control 4
static const uint8_t OV7670_REG_COM5 = 0x0E;	// common control 5
static const uint8_t OV7670_REG_COM6 = 0x0F;	// common control 6
static const uint8_t OV7670_REG_AECH = 0x10;	// exposure value 9:2
static const uint8_t OV7670_REG_CLKRC = 0x11;	// internal clock
static const uint8_t OV7670_CLK_EXT = 0x40;	//   use ext clock directly
static const uint8_t OV7670_CLK_SCALE = 0x3F;	//   int clock prescale mask
static const uint8_t OV7670_REG_COM7 = 0x12;	// common control 7
static const uint8_t OV7670_COM7_RESET = 0x80;	//   SCCB register reset
static const uint8_t OV7670_COM7_SIZE_MASK = 0x38;	//   output size mask
static const uint8_t OV7670_COM7_PIXEL_MASK = 0x05;	//   output pixel format mask
static const uint8_t OV7670_COM7_SIZE_VGA = 0x00;	//   output size VGA
static const uint8_t OV7670_COM7_SIZE_CIF = 0x20;	//   output size CIF
static const uint8_t OV7670_COM7_SIZE_QVGA = 0x10;	//   output size QVGA
static const uint8_t OV7670_COM7_SIZE_QCIF = 0x08;	//   output size QCIF
static const uint8_t OV7670_COM7_RGB = 0x04;	//   pixel format RGB
static const uint8_t OV7670_COM7_YUV = 0x00;	//   pixel format YUV
static const uint8_t OV7670_COM7_BAYER = 0x01;	//   pixel format Bayer RAW
static const uint8_t OV7670_COM7_PBAYER = 0x05;	//   pixel format processed Bayer RAW
static const uint8_t OV7670_COM7_COLORBAR = 0x02;	//   color bar enable
static const uint8_t OV7670_REG_COM8 = 0x13;	// common control 8
static const uint8_t OV7670_COM8_FASTAEC = 0x80;	//   enable fast AGC/AEC algo
static const uint8_t OV7670_COM8_AECSTEP = 0x40;	//   AEC step size unlimited
static const uint8_t OV7670_COM8_BANDING = 0x20;	//   banding filter enable
static const uint8_t OV7670_COM8_AGC = 0x04;	//   AGC (auto gain) enable
static const uint8_t OV7670_COM8_AWB = 0x02;	//   AWB (auto white balance)
static const uint8_t OV7670_COM8_AEC = 0x01;	//   AEC (auto exposure) enable
static const uint8_t OV7670_REG_COM9 = 0x14;	// common control 9, max AGC value
static const uint8_t OV7670_REG_COM10 = 0x15;	// common control 10
static const uint8_t OV7670_COM10_HSYNC = 0x40;	//   HREF changes to HSYNC
static const uint8_t OV7670_COM10_PCLK_HB = 0x20;	//   suppress PCLK on hblank
static const uint8_t OV7670_COM10_HREF_REV = 0x08;	//   HREF reverse
static const uint8_t OV7670_COM10_VS_EDGE = 0x04;	//   VSYNC change on PCLK rising
static const uint8_t OV7670_COM10_VS_NEG = 0x02;	//   VSYNC negative
static const uint8_t OV7670_COM10_HS_NEG = 0x01;	//   HSYNC negative
static const uint8_t OV7670_REG_HSTART = 0x17;	// horiz frame start high bits
static const uint8_t OV7670_REG_HSTOP = 0x18;	// horiz frame end high bits
static const uint8_t OV7670_REG_VSTART = 0x19;	// vert frame start high bits
static const uint8_t OV7670_REG_VSTOP = 0x1A;	// vert frame end high bits
static const uint8_t OV7670_REG_PSHFT = 0x1B;	// pixel delay select
static const uint8_t OV7670_REG_MIDH = 0x1C;	// manufacturer id high byte
static const uint8_t OV7670_REG_MIDL = 0x1D;	// manufacturer id low byte
static const uint8_t OV7670_REG_MVFP = 0x1E;	// mirror / vert-flip enable
static const uint8_t OV7670_MVFP_MIRROR = 0x20;	//   mirror image
static const uint8_t OV7670_MVFP_VFLIP = 0x10;	//   vertical flip
static const uint8_t OV7670_REG_LAEC = 0x1F;	// reserved
static const uint8_t OV7670_REG_ADCCTR0 = 0x20;	// ADC control
static const uint8_t OV7670_REG_ADCCTR1 = 0x21;	// reserved
static const uint8_t OV7670_REG_ADCCTR2 = 0x22;	// reserved
static const uint8_t OV7670_REG_ADCCTR3 = 0x23;	// reserved
static const uint8_t OV7670_REG_AEW = 0x24;	// AGC/AEC upper limit
static const uint8_t OV7670_REG_AEB = 0x25;	// AGC/AEC lower limit
static const uint8_t OV7670_REG_VPT = 0x26;	// AGC/AEC fast mode op region
static const uint8_t OV7670_REG_BBIAS = 0x27;	// B channel signal output bias
static const uint8_t OV7670_REG_GbBIAS = 0x28;	// Gb channel signal output bias
static const uint8_t OV7670_REG_EXHCH = 0x2A;	// dummy pixel insert MSB
static const uint8_t OV7670_REG_EXHCL = 0x2B;	// dummy pixel insert LSB
static const uint8_t OV7670_REG_RBIAS = 0x2C;	// R channel signal output bias
static const uint8_t OV7670_REG_ADVFL = 0x2D;	// insert dummy lines MSB
static const uint8_t OV7670_REG_ADVFH = 0x2E;	// insert dummy lines LSB
static const uint8_t OV7670_REG_YAVE = 0x2F;	// Y/G channel average value
static const uint8_t OV7670_REG_HSYST = 0x30;	// HSYNC rising edge delay
static const uint8_t OV7670_REG_HSYEN = 0x31;	// HSYNC falling edge delay
static const uint8_t OV7670_REG_HREF = 0x32;	// HREF control
static const uint8_t OV7670_REG_CHLF = 0x33;	// array current control
static const uint8_t OV7670_REG_ARBLM = 0x34;	// array ref control, reserved
static const uint8_t OV7670_REG_ADC = 0x37;	// ADC control, reserved
static const uint8_t OV7670_REG_ACOM = 0x38;	// ADC & analog common, reserved
static const uint8_t OV7670_REG_OFON = 0x39;	// ADC offset control, reserved
static const uint8_t OV7670_REG_TSLB = 0x3A;	// line buffer test option
static const uint8_t OV7670_TSLB_NEG = 0x20;	//   negative image enable
static const uint8_t OV7670_TSLB_YLAST = 0x04;	//   UYVY or VYUY, see COM13
static const uint8_t OV7670_TSLB_AOW = 0x01;	//   auto output window
static const uint8_t OV7670_REG_COM11 = 0x3B;	// common control 11
static const uint8_t OV7670_COM11_NIGHT = 0x80;	//   night mode
static const uint8_t OV7670_COM11_NMFR = 0x60;	//   night mode frame rate mask
static const uint8_t OV7670_COM11_HZAUTO = 0x10;	//   auto detect 50/60 Hz
static const uint8_t OV7670_COM11_BAND = 0x08;	//   banding filter value select
static const uint8_t OV7670_COM11_EXP = 0x02;	//   exposure timing control
static const uint8_t OV7670_REG_COM12 = 0x3C;	// common control 12
static const uint8_t OV7670_COM12_HREF = 0x80;	//   always has HREF
static const uint8_t OV7670_REG_COM13 = 0x3D;	// common control 13
static const uint8_t OV7670_COM13_GAMMA = 0x80;	//   gamma enable
static const uint8_t OV7670_COM13_UVSAT = 0x40;	//   UV saturation auto adjust
static const uint8_t OV7670_COM13_UVSWAP = 0x01;	//   UV swap, use with TSLB[3]
static const uint8_t OV7670_REG_COM14 = 0x3E;	// common control 14
static const uint8_t OV7670_COM14_DCWEN = 0x10;	//   DCW & scaling PCLK enable
static const uint8_t OV7670_REG_EDGE = 0x3F;	// edge enhancement adjustment
static const uint8_t OV7670_REG_COM15 = 0x40;	// common control 15
static const uint8_t OV7670_COM15_RMASK = 0xC0;	//   output range mask
static const uint8_t OV7670_COM15_R10F0 = 0x00;	//   output range 10 to F0
static const uint8_t OV7670_COM15_R01FE = 0x80;	//                01 to FE
static const uint8_t OV7670_COM15_R00FF = 0xC0;	//                00 to FF
static const uint8_t OV7670_COM15_RGBMASK = 0x30;	//   RGB 555/565 option mask
static const uint8_t OV7670_COM15_RGB = 0x00;	//   normal RGB out
static const uint8_t OV7670_COM15_RGB565 = 0x10;	//   RGB 565 output
static const uint8_t OV7670_COM15_RGB555 = 0x30;	//   RGB 555 output
static const uint8_t OV7670_REG_COM16 = 0x41;	// common control 16
static const uint8_t OV7670_COM16_AWBGAIN = 0x08;	//   AWB gain enable
static const uint8_t OV7670_REG_COM17 = 0x42;	// common control 17
static const uint8_t OV7670_COM17_AECWIN = 0xC0;	//   AEC window must match COM4
static const uint8_t OV7670_COM17_CBAR = 0x08;	//   DSP color bar enable
static const uint8_t OV7670_REG_AWBC1 = 0x43;	// reserved
static const uint8_t OV7670_REG_AWBC2 = 0x44;	// reserved
static const uint8_t OV7670_REG_AWBC3 = 0x45;	// reserved
static const uint8_t OV7670_REG_AWBC4 = 0x46;	// reserved
static const uint8_t OV7670_REG_AWBC5 = 0x47;	// reserved
static const uint8_t OV7670_REG_AWBC6 = 0x48;	// reserved
static const uint8_t OV7670_REG_REG4B = 0x4B;	// UV average enable
static const uint8_t OV7670_REG_DNSTH = 0x4C;	// de-noise strength
static const uint8_t OV7670_REG_MTX1 = 0x4F;	// matrix coefficient 1
static const uint8_t OV7670_REG_MTX2 = 0x50;	// matrix coefficient 2
static const uint8_t OV7670_REG_MTX3 = 0x51;	// matrix coefficient 3
static const uint8_t OV7670_REG_MTX4 = 0x52;	// matrix coefficient 4
static const uint8_t OV7670_REG_MTX5 = 0x53;	// matrix coefficient 5
static const uint8_t OV7670_REG_MTX6 = 0x54;	// matrix coefficient 6
static const uint8_t OV7670_REG_BRIGHT = 0x55;	// brightness control
static const uint8_t OV7670_REG_CONTRAS = 0x56;	// contrast control
static const uint8_t OV7670_REG_CONTRAS_CENTER = 0x57;	// contrast center
static const uint8_t OV7670_REG_MTXS = 0x58;	// matrix coefficient sign
static const uint8_t OV7670_REG_LCC1 = 0x62;	// lens correction option 1
static const uint8_t OV7670_REG_LCC2 = 0x63;	// lens correction option 2
static const uint8_t OV7670_REG_LCC3 = 0x64;	// lens correction option 3
static const uint8_t OV7670_REG_LCC4 = 0x65;	// lens correction option 4
static const uint8_t OV7670_REG_LCC5 = 0x66;	// lens correction option 5
static const uint8_t OV7670_REG_MANU = 0x67;	// manual U value
static const uint8_t OV7670_REG_MANV = 0x68;	// manual V value
static const uint8_t OV7670_REG_GFIX = 0x69;	// fix gain control
static const uint8_t OV7670_REG_GGAIN = 0x6A;	// G channel AWB gain
static const uint8_t OV7670_REG_DBLV = 0x6B;	// PLL & regulator control
static const uint8_t OV7670_REG_AWBCTR3 = 0x6C;	// AWB control 3
static const uint8_t OV7670_REG_AWBCTR2 = 0x6D;	// AWB control 2
static const uint8_t OV7670_REG_AWBCTR1 = 0x6E;	// AWB control 1
static const uint8_t OV7670_REG_AWBCTR0 = 0x6F;	// AWB control 0
static const uint8_t OV7670_REG_SCALING_XSC = 0x70;	// test pattern [7], X scaling [6:0]
static const uint8_t OV7670_REG_SCALING_YSC = 0x71;	// test pattern [7], Y scaling [6:0]
static const uint8_t OV7670_REG_SCALING_DCWCTR = 0x72;	// DCW control
static const uint8_t OV7670_REG_SCALING_PCLK_DIV = 0x73;	// DSP scale control clock divide
static const uint8_t OV7670_REG_REG74 = 0x74;	// digital gain control
static const uint8_t OV7670_REG_REG76 = 0x76;	// pixel correction
static const uint8_t OV7670_R76_BLKPCOR = 0x80;	//   black pixel correction enable
static const uint8_t OV7670_R76_WHTPCOR = 0x40;	//   white pixel correction enable
static const uint8_t OV7670_REG_SLOP = 0x7A;	// gamma curve highest segment slope
static const uint8_t OV7670_REG_GAM_BASE = 0x7B;	// gamma register base (1 of 15)
static const uint8_t OV7670_GAM_LEN = 15;	// number of gamma registers
static const uint8_t OV7670_REG_RGB444 = 0x8C;	// RGB 444 control
static const uint8_t OV7670_R444_ENABLE = 0x02;	//   RGB444 enable
static const uint8_t OV7670_R444_RGBX = 0x01;	//   RGB444 word format
static const uint8_t OV7670_REG_DM_LNL = 0x92;	// dummy line LSB
static const uint8_t OV7670_REG_LCC6 = 0x94;	// lens correction option 6
static const uint8_t OV7670_REG_LCC7 = 0x95;	// lens correction option 7
static const uint8_t OV7670_REG_HAECC1 = 0x9F;	// histogram-based AEC/AGC control 1
static const uint8_t OV7670_REG_HAECC2 = 0xA0;	// histogram-based AEC/AGC control 2
static const uint8_t OV7670_REG_SCALING_PCLK_DELAY = 0xA2;	// scaling pixel clock delay
static const uint8_t OV7670_REG_BD50MAX = 0xA5;	// 50 Hz banding step limit
static const uint8_t OV7670_REG_HAECC3 = 0xA6;	// histogram-based AEC/AGC control 3
static const uint8_t OV7670_REG_HAECC4 = 0xA7;	// histogram-based AEC/AGC control 4
static const uint8_t OV7670_REG_HAECC5 = 0xA8;	// histogram-based AEC/AGC control 5
static const uint8_t OV7670_REG_HAECC6 = 0xA9;	// histogram-based AEC/AGC control 6
static const uint8_t OV7670_REG_HAECC7 = 0xAA;	// histogram-based AEC/AGC control 7
static const uint8_t OV7670_REG_BD60MAX = 0xAB;	// 60 Hz banding step limit
static const uint8_t OV7670_REG_ABLC1 = 0xB1;	// ABLC enable
static const uint8_t OV7670_REG_THL_ST = 0xB3;	// ABLC target
static const uint8_t OV7670_REG_SATCTR = 0xC9;	// saturation control

static const uint8_t OV7670_REG_LAST = OV7670_REG_SATCTR;	// highest register address

// bits 6:0 of SCALING_XSC / SCALING_YSC hold the scale factor, bit 7 one bit
// of the test pattern
static const uint8_t OV7670_SCALING_TEST_PATTERN = 0x80;
static const uint8_t OV7670_SCALING_FACTOR_MASK = 0x7F;

// COM11 bits 7:5 hold the night mode, bits 4:0 are left alone
static const uint8_t OV7670_COM11_NIGHT_MASK = 0xE0;

// horizontal timing period in pixels, including blanking
static const int OV7670_HTOTAL = 784;

struct sensor_reg {
	uint8_t reg;
	uint8_t val;
};

// per size class window tuning, indexed by PicoOV7670_size
struct sensor_window {
	int vstart;
	int hstart;
	int edge_offset;
	int pclk_delay;
};

extern const sensor_reg ov7670_init_regs[];
extern const size_t ov7670_init_regs_count;

extern const sensor_reg ov7670_rgb565_regs[];
extern const size_t ov7670_rgb565_regs_count;

extern const sensor_reg ov7670_yuv_regs[];
extern const size_t ov7670_yuv_regs_count;

extern const sensor_window ov7670_window[5];

#endif
