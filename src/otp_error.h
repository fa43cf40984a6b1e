#ifndef OTP_ERROR_H
#define OTP_ERROR_H

#include <string>

namespace OTP {

    // Failure kinds returned by the OTP operations. None means success.
    enum class OtpError {
        None,
        InvalidDigitCount,
        InvalidThreshold,
        RandomSourceError,
        QrEncodingCapacityExceeded,
        InvalidTime,
        InvalidPeriod,
        InvalidSecretLength,
        InvalidConfig
    };

    std::string errorMessage(OtpError error);

}

#endif // OTP_ERROR_H
