#include "NonceGenerator.hpp"
#include "RedactionSession.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace redaction
{

namespace
{

constexpr std::array<std::string_view, 10> kFirstNames = {
    "Alice", "Bob", "Carol", "David", "Eve", "Frank", "Grace", "Henry", "Iris", "Jack"
};

constexpr std::array<std::string_view, 10> kLastNames = {
    "Anderson", "Brown", "Chen", "Davis", "Evans", "Foster", "Garcia", "Harris", "Irving", "Jones"
};

constexpr std::array<std::string_view, 4> kEmailDomains = { "example.com", "test.org", "sample.net", "demo.io" };

constexpr std::array<std::string_view, 5> kStreets = { "Example St", "Test Ave", "Sample Blvd", "Demo Ln", "Mock Dr" };

constexpr std::array<std::string_view, 5> kCities = { "Anytown", "Somewhere", "Testville", "Mocksburg", "Sampletown" };

constexpr std::size_t kCollisionSuffixLength = 4;

std::string zeroPad(std::size_t value, int width)
{
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

std::string nameNonce(std::size_t counter)
{
    std::string nonce(kFirstNames[counter % kFirstNames.size()]);
    nonce += ' ';
    nonce += kLastNames[(counter / kFirstNames.size()) % kLastNames.size()];
    return nonce;
}

std::string emailNonce(std::size_t counter)
{
    std::string nonce(kFirstNames[counter % kFirstNames.size()]);
    for (auto& c : nonce)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    nonce += std::to_string(counter);
    nonce += '@';
    nonce += kEmailDomains[counter % kEmailDomains.size()];
    return nonce;
}

// 555-0100 through 555-0199 are reserved for fictional use
std::string phoneNonce(std::size_t counter) { return "555-01" + zeroPad(counter % 100, 2); }

// Area 900-999 is never issued
std::string ssnNonce(std::size_t counter)
{
    return "900-" + zeroPad(counter % 5, 2) + "-" + zeroPad(counter % 10000, 4);
}

std::string addressNonce(std::size_t counter)
{
    std::string nonce = std::to_string(100 + counter);
    nonce += ' ';
    nonce += kStreets[counter % kStreets.size()];
    nonce += ", ";
    nonce += kCities[(counter / kStreets.size()) % kCities.size()];
    return nonce;
}

std::string customNonce(std::size_t counter) { return "[REDACTED-" + zeroPad(counter + 1, 3) + "]"; }

} // namespace

std::string generateNonce(PIICategory category, RedactionSession& session)
{
    const std::size_t counter = session.nextCounter(category);

    std::string nonce;
    switch (category)
    {
    case PIICategory::Name:
        nonce = nameNonce(counter);
        break;
    case PIICategory::Email:
        nonce = emailNonce(counter);
        break;
    case PIICategory::Phone:
        nonce = phoneNonce(counter);
        break;
    case PIICategory::Ssn:
        nonce = ssnNonce(counter);
        break;
    case PIICategory::Address:
        nonce = addressNonce(counter);
        break;
    case PIICategory::Custom:
    default:
        nonce = customNonce(counter);
        break;
    }

    while (session.isNonceUsed(nonce))
    {
        nonce += '_';
        nonce += session.randomSuffix(kCollisionSuffixLength);
    }
    session.markNonceUsed(nonce);

    return nonce;
}

} // namespace redaction
