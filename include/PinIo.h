#ifndef PIN_IO_H
#define PIN_IO_H

#include <stdint.h>

#include "PinTypes.h"

// Hardware access used by PinSampler. Every read returns false when the
// pin cannot be read; the out parameter is then left untouched.
class PinIo {
    public:
        virtual ~PinIo() {}

        // pinMode / ADC / touch channel setup for one descriptor
        virtual bool configure(const PinDescriptor &pin) = 0;

        virtual bool readDigital(uint8_t gpio, bool &level) = 0;
        virtual bool readAnalog(uint8_t gpio, uint16_t &raw) = 0;
        virtual bool readTouch(uint8_t gpio, uint32_t &raw) = 0;
};

#endif
