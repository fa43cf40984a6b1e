#include "qr.h"

#include <sstream>

#include <qrcodegen.hpp>

#include "log.h"

namespace OTP {

    namespace {
        std::string toSvg(const qrcodegen::QrCode& qr) {
            int size = qr.getSize() + 2 * QR_BORDER;

            std::ostringstream out;
            out << "<svg xmlns='http://www.w3.org/2000/svg' version='1.1' width='50mm' height='50mm' "
                << "viewBox='0 0 " << size << " " << size << "'>\n";
            out << "  <rect width='" << size << "' height='" << size << "' fill='white'/>";
            out << " <path fill='black' d='\n";

            for (int y = 0; y < qr.getSize(); y++) {
                for (int x = 0; x < qr.getSize(); x++) {
                    if (qr.getModule(x, y)) {
                        out << "   M " << (x + QR_BORDER) << "," << (y + QR_BORDER) << " l 1,0 0,1 -1,0 z\n";
                    }
                }
            }

            out << "  ' />\n</svg>\n";
            return out.str();
        }
    }

    OtpError renderQrSvg(const std::string& text, std::string& svg) {
        try {
            qrcodegen::QrCode qr = qrcodegen::QrCode::encodeText(text.c_str(), qrcodegen::QrCode::Ecc::MEDIUM);
            Log::debug("Encoded " + std::to_string(text.size()) + " bytes as a " +
                       std::to_string(qr.getSize()) + "x" + std::to_string(qr.getSize()) + " QR code");
            svg = toSvg(qr);
        } catch (const qrcodegen::data_too_long& e) {
            Log::error(std::string("QR code encoding failed: ") + e.what());
            return OtpError::QrEncodingCapacityExceeded;
        }

        return OtpError::None;
    }

}
