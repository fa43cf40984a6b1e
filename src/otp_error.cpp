#include "otp_error.h"

namespace OTP {

    std::string errorMessage(OtpError error) {
        switch (error) {
            case OtpError::None:
                return "Success";
            case OtpError::InvalidDigitCount:
                return "Invalid number of digits in the code. Must be 6, 7 or 8 digits";
            case OtpError::InvalidThreshold:
                return "Invalid code: synchronization threshold reached";
            case OtpError::RandomSourceError:
                return "Random source failed to provide secret bytes";
            case OtpError::QrEncodingCapacityExceeded:
                return "URI exceeds the maximum QR code capacity";
            case OtpError::InvalidTime:
                return "Current time is before the start of the counting window";
            case OtpError::InvalidPeriod:
                return "Time step period must be greater than zero";
            case OtpError::InvalidSecretLength:
                return "Secret length must be a positive multiple of 8 bits";
            case OtpError::InvalidConfig:
                return "Invalid configuration value";
        }
        return "Unknown error";
    }

}
