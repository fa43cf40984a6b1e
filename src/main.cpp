#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>

#include "base32.h"
#include "config.h"
#include "hotp.h"
#include "log.h"
#include "qr.h"
#include "secret.h"
#include "totp.h"
#include "uri.h"
#include "verifier.h"

using namespace std;
using namespace OTP;

static void showHelp() {
    cout << "OTP control" << endl;
    cout << "Usage:" << endl;
    cout << "  otpctl [-v] register <label> [issuer [svg-file]] - Create a secret and its QR code" << endl;
    cout << "  otpctl [-v] code <secret> [unix-time] - Print the code for a Base32 secret" << endl;
    cout << "  otpctl [-v] verify <secret> <code> - Check a code against the current time" << endl;
    cout << "  otpctl help - Show this help" << endl;
    cout << endl;
    cout << "Environment: OTP_PERIOD, OTP_T0, OTP_DRIFT, OTP_DIGITS, OTP_THRESHOLD," << endl;
    cout << "             OTP_SECRET_BITS, OTP_ISSUER, OTP_DEBUG" << endl;
}

static int registerAccount(const OtpConfig& config, const string& label, const string& svgPath) {
    OpenSslRandomSource rng;
    vector<uint8_t> secret;
    OtpError error = generateSecret(rng, secret, config.secretBits);
    if (error != OtpError::None) {
        cerr << "Failed to generate secret: " << errorMessage(error) << endl;
        return 1;
    }

    string uri = buildTotpUri(label, secret, config);
    Log::debug("Provisioning URI: " + uri);

    string svg;
    error = renderQrSvg(uri, svg);
    if (error != OtpError::None) {
        cerr << "Failed to render QR code: " << errorMessage(error) << endl;
        return 1;
    }

    ofstream file(svgPath, ios::trunc);
    if (!file.is_open()) {
        cerr << "Failed to open " << svgPath << " for writing" << endl;
        return 1;
    }
    file << svg;
    file.close();
    if (!file) {
        cerr << "Failed to write " << svgPath << endl;
        return 1;
    }

    cout << "Secret: " << Base32::encode(secret, false) << endl;
    cout << "URI: " << uri << endl;
    Log::info("QR code written to " + svgPath + ", scan it with an authenticator app");
    return 0;
}

static int printCode(const OtpConfig& config, const string& secret, const char* timeArg) {
    TOTP generator(secret, config.digits, config.period, config.t0);

    uint64_t now = currentUnixTime();
    if (timeArg && !parseUnsigned("unix-time", timeArg, now)) {
        return 1;
    }

    cout << "Code: " << generator.generateCodeAt(now) << endl;
    cout << "Valid for " << generator.secondsRemaining(now) << "s" << endl;
    return 0;
}

static int verifyCode(const OtpConfig& config, const string& secret, const string& codeText) {
    int code = 0;
    if (parseCode(codeText, config.digits, code) != OtpError::None) {
        cerr << "Error, code must be exactly " << config.digits << " decimal digits" << endl;
        return 1;
    }

    VerificationResult result = verifyNow(Base32::decode(secret), code, config);
    if (!result) {
        cerr << errorMessage(result.error()) << endl;
        return 1;
    }

    // The counter starts drift steps in the past
    long long drift = static_cast<long long>(result.steps()) - static_cast<long long>(config.drift);
    cout << "Valid code. Drift : " << drift << " steps" << endl;
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        int argi = 1;
        if (argi < argc && strcmp(argv[argi], "-v") == 0) {
            Log::setVerbose(true);
            argi++;
        }
        if (const char* debug = getenv("OTP_DEBUG")) {
            if (strcmp(debug, "0") != 0) {
                Log::setVerbose(true);
            }
        }

        if (argc - argi < 1) {
            showHelp();
            return 1;
        }

        OtpConfig config;
        OtpError error = loadConfigFromEnv(config);
        if (error != OtpError::None) {
            cerr << errorMessage(error) << endl;
            return 1;
        }

        string command = argv[argi];
        int nargs = argc - argi - 1;
        Log::debug("Command: '" + command + "', arguments: " + to_string(nargs));

        if (command == "register" && nargs >= 1 && nargs <= 3) {
            string label = argv[argi + 1];
            if (nargs >= 2) {
                config.issuer = argv[argi + 2];
            }
            string svgPath = nargs == 3 ? argv[argi + 3] : label + ".svg";
            return registerAccount(config, label, svgPath);
        }
        else if (command == "code" && (nargs == 1 || nargs == 2)) {
            return printCode(config, argv[argi + 1], nargs == 2 ? argv[argi + 2] : nullptr);
        }
        else if (command == "verify" && nargs == 2) {
            return verifyCode(config, argv[argi + 1], argv[argi + 2]);
        }
        else if (command == "help") {
            showHelp();
        }
        else {
            Log::debug("Command not recognized or incorrect number of arguments");
            showHelp();
            return 1;
        }
    } catch (const std::exception& e) {
        cerr << "Fatal error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
