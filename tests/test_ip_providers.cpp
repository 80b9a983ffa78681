#include <gtest/gtest.h>

#include "Fakes.h"
#include "services/IpApiProvider.h"
#include "services/IpWhoIsProvider.h"

static const char *IPAPI_URL = "https://ipapi.co/json/";
static const char *IPWHO_URL =
    "https://ipwho.is/"
    "?fields=success,message,latitude,longitude,city,region,country";

static std::string failureOf(LocationProvider &provider) {
  try {
    provider.fetch();
  } catch (const RecoverableProviderError &e) {
    return e.what();
  }
  return "no failure";
}

TEST(IpApiProviderTest, ParsesLocation) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 200,
               R"({"ip":"1.2.3.4","city":"Reykjavik","region":"Capital",
                   "country":"IS","country_name":"Iceland",
                   "latitude":64.1355,"longitude":-21.8954})");
  IpApiProvider provider(http);

  IpLocation loc = provider.fetch();
  EXPECT_DOUBLE_EQ(loc.coordinate.latitude, 64.1355);
  EXPECT_DOUBLE_EQ(loc.coordinate.longitude, -21.8954);
  EXPECT_EQ(loc.city, "Reykjavik");
  EXPECT_EQ(loc.region, "Capital");
  EXPECT_EQ(loc.country, "Iceland");
  EXPECT_EQ(http.lastTimeout, 5);
}

TEST(IpApiProviderTest, MissingFieldsBecomeUnknown) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 200,
               R"({"latitude":1.5,"longitude":2.5,"city":null,"country":"FI"})");
  IpApiProvider provider(http);

  IpLocation loc = provider.fetch();
  EXPECT_EQ(loc.city, "Unknown");
  EXPECT_EQ(loc.region, "Unknown");
  EXPECT_EQ(loc.country, "FI");
}

TEST(IpApiProviderTest, ErrorFlagIsReported) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 429,
               R"({"error":true,"reason":"RateLimited",
                   "message":"Visit https://ipapi.co/ratelimited/"})");
  IpApiProvider provider(http);

  EXPECT_EQ(failureOf(provider),
            "ipapi.co: RateLimited (Visit https://ipapi.co/ratelimited/)");
}

TEST(IpApiProviderTest, ErrorFlagWithoutDetails) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 200, R"({"error":true})");
  IpApiProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipapi.co: error (no message)");
}

TEST(IpApiProviderTest, NonOkStatusWithCoordinatesFails) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 503, R"({"latitude":1.0,"longitude":2.0})");
  IpApiProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipapi.co: unexpected response (status=503)");
}

TEST(IpApiProviderTest, TransportFaultIsRecoverable) {
  FakeHttpClient http;
  http.fail(IPAPI_URL, "Timeout was reached");
  IpApiProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipapi.co: Timeout was reached");
}

TEST(IpApiProviderTest, MalformedBodyIsRecoverable) {
  FakeHttpClient http;
  http.respond(IPAPI_URL, 200, "<html>rate limited</html>");
  IpApiProvider provider(http);

  EXPECT_EQ(failureOf(provider).rfind("ipapi.co: ", 0), 0u);
}

TEST(IpWhoIsProviderTest, ParsesLocation) {
  FakeHttpClient http;
  http.respond(IPWHO_URL, 200,
               R"({"success":true,"latitude":69.6492,"longitude":18.9553,
                   "city":"Tromso","region":"Troms","country":"Norway"})");
  IpWhoIsProvider provider(http, 3);

  IpLocation loc = provider.fetch();
  EXPECT_DOUBLE_EQ(loc.coordinate.latitude, 69.6492);
  EXPECT_EQ(loc.city, "Tromso");
  EXPECT_EQ(loc.country, "Norway");
  EXPECT_EQ(http.lastTimeout, 3);
}

TEST(IpWhoIsProviderTest, SuccessFalseIsReported) {
  FakeHttpClient http;
  http.respond(IPWHO_URL, 200,
               R"({"success":false,"message":"Reserved range"})");
  IpWhoIsProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipwho.is: Reserved range");
}

TEST(IpWhoIsProviderTest, SuccessFalseWithoutMessage) {
  FakeHttpClient http;
  http.respond(IPWHO_URL, 200, R"({"success":false})");
  IpWhoIsProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipwho.is: error");
}

TEST(IpWhoIsProviderTest, MissingCoordinates) {
  FakeHttpClient http;
  http.respond(IPWHO_URL, 200, R"({"success":true,"city":"Nowhere"})");
  IpWhoIsProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipwho.is: unexpected response (status=200)");
}

TEST(IpWhoIsProviderTest, TransportFaultIsRecoverable) {
  FakeHttpClient http;
  IpWhoIsProvider provider(http);

  EXPECT_EQ(failureOf(provider), "ipwho.is: Could not resolve host");
}
