#include "PicoOV7670_mclk.h"


int PicoOV7670_mclk_setup(uint32_t sys_freq, uint32_t mclk_freq, PicoOV7670_mclk_pwm *pwm)
{
	if (mclk_freq == 0)
		return 0;

	// one PWM period per MCLK period, the divider is only raised if the
	// period doesn't fit the 16 bit counter
	uint32_t div = 1;
	uint32_t period = (sys_freq + mclk_freq / 2) / mclk_freq;
	while (div < 255 && period / div > 0x10000)
		div++;
	period = period / div;
	if (period > 0x10000)
		period = 0x10000;
	if (period < 2)
		period = 2;

	pwm->div = div;
	pwm->period = period;
	pwm->freq = sys_freq / (div * period);
	return 1;
}
