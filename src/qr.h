#ifndef OTP_QR_H
#define OTP_QR_H

#include <string>

#include "otp_error.h"

namespace OTP {

    static constexpr int QR_BORDER = 4;

    // Renders text (typically a provisioning URI) as a 50x50 mm SVG element
    // that can be embedded in an HTML page. Each dark module becomes a unit
    // square of a single path, with a 4-module quiet zone around the symbol.
    // Returns QrEncodingCapacityExceeded when text does not fit any QR version.
    OtpError renderQrSvg(const std::string& text, std::string& svg);

}

#endif // OTP_QR_H
