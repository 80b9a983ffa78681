#include <gtest/gtest.h>

#include "Fakes.h"
#include "core/Constants.h"
#include "services/LocationResolver.h"

#include <memory>
#include <vector>

class LocationResolverTest : public ::testing::Test {
protected:
  LocationResolver
  makeResolver(std::vector<std::unique_ptr<LocationProvider>> providers) {
    return LocationResolver(cache_, std::move(providers));
  }

  std::unique_ptr<LocationProvider> working(const char *name,
                                            const IpLocation &loc) {
    return std::make_unique<FakeLocationProvider>(name, loc, &calls_);
  }

  std::unique_ptr<LocationProvider> broken(const char *name,
                                           const std::string &why) {
    return std::make_unique<FakeLocationProvider>(name, why, &calls_);
  }

  TtlLruCache cache_{50};
  int calls_ = 0;
  IpLocation fairbanks_ =
      makeLocation(64.84, -147.72, "Fairbanks", "Alaska", "United States");
  IpLocation tromso_ = makeLocation(69.65, 18.96, "Tromso", "Troms", "Norway");
};

TEST_F(LocationResolverTest, UsesUserCoordinatesWithoutNetwork) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  ResolvedLocation r = resolver.resolve(10.0, 20.0);
  EXPECT_EQ(r.source, LocationSource::User);
  EXPECT_DOUBLE_EQ(r.coordinate.latitude, 10.0);
  EXPECT_DOUBLE_EQ(r.coordinate.longitude, 20.0);
  EXPECT_FALSE(r.note.has_value());
  EXPECT_FALSE(r.ipLocation.has_value());
  EXPECT_EQ(r.displayName, "10.00°, 20.00°");
  EXPECT_EQ(calls_, 0);
}

TEST_F(LocationResolverTest, RejectsOutOfRangeLatitude) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  try {
    resolver.resolve(91.0, 0.0);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_STREQ(e.what(), "Latitude must be between -90 and 90");
  }
  EXPECT_EQ(calls_, 0);
}

TEST_F(LocationResolverTest, RejectsOutOfRangeLongitude) {
  auto resolver = makeResolver({});
  try {
    resolver.resolve(45.0, -180.5);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_STREQ(e.what(), "Longitude must be between -180 and 180");
  }
}

TEST_F(LocationResolverTest, AcceptsBoundaryValues) {
  auto resolver = makeResolver({});
  EXPECT_NO_THROW(resolver.resolve(-90.0, 180.0));
  EXPECT_NO_THROW(resolver.resolve(90.0, -180.0));
}

TEST_F(LocationResolverTest, PartialCoordinatesFallBackToIp) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  ResolvedLocation r = resolver.resolve(10.0, std::nullopt);
  EXPECT_EQ(r.source, LocationSource::Ip);
  ASSERT_TRUE(r.note.has_value());
  EXPECT_EQ(*r.note, LocationResolver::PARTIAL_NOTE);
  EXPECT_DOUBLE_EQ(r.coordinate.latitude, 64.84);
  EXPECT_EQ(r.displayName, "Fairbanks, Alaska, United States");
  ASSERT_TRUE(r.ipLocation.has_value());
  EXPECT_EQ(r.ipLocation->country, "United States");
  EXPECT_EQ(calls_, 1);
}

TEST_F(LocationResolverTest, PartialCoordinatesSkipValidation) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  ResolvedLocation r = resolver.resolve(std::nullopt, 500.0);
  EXPECT_EQ(r.source, LocationSource::Ip);
  EXPECT_TRUE(r.note.has_value());
}

TEST_F(LocationResolverTest, NoCoordinatesHasNoNote) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  ResolvedLocation r = resolver.resolve(std::nullopt, std::nullopt);
  EXPECT_EQ(r.source, LocationSource::Ip);
  EXPECT_FALSE(r.note.has_value());
}

TEST_F(LocationResolverTest, FallsBackToSecondProvider) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(
      broken("ipapi.co", "ipapi.co: RateLimited (Too many requests)"));
  providers.push_back(working("ipwho.is", tromso_));
  auto resolver = makeResolver(std::move(providers));

  IpLookupResult r = resolver.lookupIp();
  EXPECT_EQ(r.provider, "ipwho.is");
  EXPECT_EQ(r.location.city, "Tromso");
  EXPECT_DOUBLE_EQ(r.location.coordinate.longitude, 18.96);
  ASSERT_EQ(r.failures.size(), 1u);
  EXPECT_EQ(r.failures[0], "ipapi.co: RateLimited (Too many requests)");
  EXPECT_EQ(calls_, 2);
}

TEST_F(LocationResolverTest, StopsAtFirstSuccess) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  providers.push_back(working("ipwho.is", tromso_));
  auto resolver = makeResolver(std::move(providers));

  IpLookupResult r = resolver.lookupIp();
  EXPECT_EQ(r.provider, "ipapi.co");
  EXPECT_TRUE(r.failures.empty());
  EXPECT_EQ(calls_, 1);
}

TEST_F(LocationResolverTest, AllProvidersFailing) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(broken("ipapi.co", "ipapi.co: timed out"));
  providers.push_back(broken("ipwho.is", "ipwho.is: Reserved range"));
  auto resolver = makeResolver(std::move(providers));

  try {
    resolver.resolve(std::nullopt, std::nullopt);
    FAIL() << "expected LocationUnavailableError";
  } catch (const LocationUnavailableError &e) {
    EXPECT_STREQ(e.what(), "Could not determine location from IP. "
                           "ipapi.co: timed out; ipwho.is: Reserved range");
  }
  EXPECT_EQ(calls_, 2);
  EXPECT_EQ(cache_.stats().size, 0u);
}

TEST_F(LocationResolverTest, NoProvidersConfigured) {
  auto resolver = makeResolver({});
  try {
    resolver.lookupIp();
    FAIL() << "expected LocationUnavailableError";
  } catch (const LocationUnavailableError &e) {
    EXPECT_STREQ(e.what(),
                 "Could not determine location from IP. No providers "
                 "available.");
  }
}

TEST_F(LocationResolverTest, CachesIpLocation) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(working("ipapi.co", fairbanks_));
  auto resolver = makeResolver(std::move(providers));

  resolver.lookupIp();
  IpLookupResult again = resolver.lookupIp();
  EXPECT_EQ(calls_, 1);
  EXPECT_EQ(again.location.city, "Fairbanks");
  EXPECT_TRUE(again.provider.empty());

  auto stored = cache_.get(AuroraCast::KEY_USER_LOCATION, 3600);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ((*stored)["region"], "Alaska");
}

TEST_F(LocationResolverTest, FailedLookupIsRetriedNextTime) {
  std::vector<std::unique_ptr<LocationProvider>> providers;
  providers.push_back(broken("ipapi.co", "ipapi.co: timed out"));
  auto resolver = makeResolver(std::move(providers));

  EXPECT_THROW(resolver.lookupIp(), LocationUnavailableError);
  EXPECT_THROW(resolver.lookupIp(), LocationUnavailableError);
  EXPECT_EQ(calls_, 2);
  EXPECT_EQ(cache_.stats().misses, 2u);
}
