#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "hotp.h"
#include "totp.h"
#include "verifier.h"
#include "test_helpers.h"

using namespace OTP;

namespace {
    // RFC 4226 Appendix D, 6-digit codes for counters 0..9
    const int APPENDIX_D_CODES[] = {
        755224, 287082, 359152, 969429, 338314, 254676, 287922, 162583, 399871, 520489
    };
}

TEST(VerifierTest, CountsDigits) {
    EXPECT_EQ(countDigits(0), 1);
    EXPECT_EQ(countDigits(99999), 5);
    EXPECT_EQ(countDigits(100000), 6);
    EXPECT_EQ(countDigits(9999999), 7);
    EXPECT_EQ(countDigits(99999999), 8);
    EXPECT_EQ(countDigits(100000000), 9);
}

TEST(VerifierTest, AcceptsCodeAheadAndReportsSteps) {
    for (int k = 0; k < 10; k++) {
        SCOPED_TRACE(k);
        VerificationResult result = verify(rfcSecret(), Counter(0), APPENDIX_D_CODES[k], 10);
        ASSERT_TRUE(result.isSynchronized());
        EXPECT_EQ(result.steps(), k);
        EXPECT_EQ(result.error(), OtpError::None);
    }
}

TEST(VerifierTest, FirstMatchWins) {
    // Starting at counter 3 the code of counter 5 is two increments away
    VerificationResult result = verify(rfcSecret(), Counter(3), APPENDIX_D_CODES[5]);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 2);
}

TEST(VerifierTest, DoesNotSearchBackward) {
    VerificationResult result = verify(rfcSecret(), Counter(5), APPENDIX_D_CODES[4], 5);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, CodeBeyondThresholdIsRejected) {
    VerificationResult result = verify(rfcSecret(), Counter(0), APPENDIX_D_CODES[9], 9);
    EXPECT_FALSE(result.isSynchronized());
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, WrongCodeExhaustsAttempts) {
    VerificationResult result = verify(rfcSecret(), Counter(0), 123456, 10);
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, InfersDigitCountFromLength) {
    // 8-digit HOTP of counter 1 is 94287082
    VerificationResult result = verify(rfcSecret(), Counter(0), 94287082, 10);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 1);
}

TEST(VerifierTest, InfersSevenDigitCode) {
    // 7-digit HOTP of counter 0 is 4755224
    VerificationResult result = verify(rfcSecret(), Counter(0), 4755224, 10);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 0);
}

TEST(VerifierTest, RejectedResultAlwaysCarriesError) {
    EXPECT_THROW(VerificationResult::rejected(OtpError::None), std::invalid_argument);

    VerificationResult result = VerificationResult::rejected(OtpError::InvalidThreshold);
    EXPECT_FALSE(result.isSynchronized());
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, DigitRangeBoundaries) {
    EXPECT_EQ(verify(rfcSecret(), Counter(0), 99999, 10).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verify(rfcSecret(), Counter(0), 100000000, 10).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verify(rfcSecret(), Counter(0), -1, 10).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verify(rfcSecret(), Counter(0), 100000, 10).error(), OtpError::InvalidThreshold);
    EXPECT_EQ(verify(rfcSecret(), Counter(0), 99999999, 10).error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, ZeroThresholdIsRejected) {
    EXPECT_EQ(verify(rfcSecret(), Counter(0), APPENDIX_D_CODES[0], 0).error(), OtpError::InvalidThreshold);
    EXPECT_EQ(verify(rfcSecret(), Counter(0), 99999, 0).error(), OtpError::InvalidThreshold);
}

TEST(VerifierTest, CounterNearWrapIsSearched) {
    Counter start(std::numeric_limits<uint64_t>::max());
    int code = 0;
    ASSERT_EQ(hotp(rfcSecret(), Counter(0), 8, code), OtpError::None);
    VerificationResult result = verifyWithDigits(rfcSecret(), start, code, 8, 2);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 1);
}

TEST(VerifierWithDigitsTest, AcceptsLeadingZeros) {
    // RFC 6238: 07081804 at step 0x23523EC
    VerificationResult result = verifyWithDigits(rfcSecret(), Counter(0x23523EC), 7081804, 8);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 0);
}

TEST(VerifierWithDigitsTest, RejectsOutOfRangeCodes) {
    EXPECT_EQ(verifyWithDigits(rfcSecret(), Counter(0), 1000000, 6).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verifyWithDigits(rfcSecret(), Counter(0), -5, 6).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verifyWithDigits(rfcSecret(), Counter(0), 755224, 5).error(), OtpError::InvalidDigitCount);
    EXPECT_EQ(verifyWithDigits(rfcSecret(), Counter(0), 755224, 9).error(), OtpError::InvalidDigitCount);
}

TEST(VerifierWithDigitsTest, UsesStatedDigitCount) {
    // 755224 is the 6-digit code of counter 0, not a 7-digit one
    EXPECT_TRUE(verifyWithDigits(rfcSecret(), Counter(0), 755224, 6, 1));
    EXPECT_EQ(verifyWithDigits(rfcSecret(), Counter(0), 755224, 7, 1).error(), OtpError::InvalidThreshold);
}

// Server at a step boundary, drift 2 and a window of 2 * drift + 1 counters
class DriftWindowTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW = 1111111110ULL; // 37037037 * 30
    static constexpr int WINDOW = 5;

    VerificationResult verifyClientAt(uint64_t clientTime) {
        Counter counter;
        EXPECT_EQ(totpCounter(NOW, counter, 30, 0, 2), OtpError::None);

        TOTP client(rfcSecret(), 8);
        int code = std::stoi(client.generateCodeAt(clientTime));
        return verifyWithDigits(rfcSecret(), counter, code, 8, WINDOW);
    }
};

TEST_F(DriftWindowTest, ClientOnTime) {
    VerificationResult result = verifyClientAt(NOW);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 2);
}

TEST_F(DriftWindowTest, ClientAheadBy59Seconds) {
    VerificationResult result = verifyClientAt(NOW + 59);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 3);
}

TEST_F(DriftWindowTest, ClientBehindBy59Seconds) {
    VerificationResult result = verifyClientAt(NOW - 59);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.steps(), 0);
}

TEST_F(DriftWindowTest, ClientAheadBy120SecondsIsRejected) {
    VerificationResult result = verifyClientAt(NOW + 120);
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST_F(DriftWindowTest, ClientBehindBeyondDriftIsRejected) {
    VerificationResult result = verifyClientAt(NOW - 61);
    EXPECT_EQ(result.error(), OtpError::InvalidThreshold);
}

TEST(VerifyNowTest, AcceptsCurrentCode) {
    OtpConfig config;
    TOTP client(rfcSecret(), config.digits, config.period);
    // A step change between generating and verifying leaves the client one
    // step behind the server, still inside the drift window
    int code = std::stoi(client.generateCode());
    VerificationResult result = verifyNow(rfcSecret(), code, config);
    ASSERT_TRUE(result);
    EXPECT_GE(result.steps(), 1);
    EXPECT_LE(result.steps(), 2);
}

TEST(VerifyNowTest, ReportsDerivationFailure) {
    OtpConfig config;
    config.t0 = currentUnixTime() + 3600;
    VerificationResult result = verifyNow(rfcSecret(), 755224, config);
    EXPECT_EQ(result.error(), OtpError::InvalidTime);
}
