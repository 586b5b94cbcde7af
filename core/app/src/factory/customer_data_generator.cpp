#include "orderflow/factory/customer_data_generator.hpp"

#include <array>
#include <string_view>

namespace orderflow {

namespace {

constexpr std::array<std::string_view, 20> kFirstNames{
    "james", "mary",   "robert", "patricia", "john",   "jennifer", "michael",
    "linda", "david",  "elena",  "william",  "sarah",  "daniel",   "karen",
    "aisha", "carlos", "mei",    "omar",     "sofia",  "thomas",
};

constexpr std::array<std::string_view, 20> kLastNames{
    "smith",  "johnson", "williams", "brown",  "jones",    "garcia", "miller",
    "davis",  "martinez", "lopez",   "wilson", "anderson", "taylor", "moore",
    "nguyen", "patel",   "kim",      "clark",  "lewis",    "walker",
};

constexpr std::array<std::string_view, 6> kMailDomains{
    "example.com", "example.net", "example.org",
    "mail.test",   "inbox.test",  "shop.test",
};

constexpr std::array<std::string_view, 16> kStreetNames{
    "Maple",  "Oak",      "Pine",   "Cedar",   "Elm",    "Washington",
    "Lake",   "Hill",     "Park",   "Sunset",  "Main",   "Lincoln",
    "Church", "Highland", "Willow", "Meadow",
};

constexpr std::array<std::string_view, 8> kStreetSuffixes{
    "Street", "Avenue", "Road", "Lane", "Drive", "Court", "Boulevard", "Way",
};

constexpr std::array<std::string_view, 16> kCities{
    "Springfield", "Riverside", "Franklin",  "Greenville",
    "Bristol",     "Clinton",   "Fairview",  "Salem",
    "Madison",     "Georgetown", "Arlington", "Ashland",
    "Dover",       "Oxford",    "Jackson",   "Burlington",
};

constexpr std::array<std::string_view, 20> kStateCodes{
    "AL", "AZ", "CA", "CO", "FL", "GA", "IL", "IN", "MA", "MI",
    "MN", "NC", "NJ", "NY", "OH", "OR", "PA", "TX", "VA", "WA",
};

constexpr std::array<std::string_view, 8> kCountryCodes{
    "USA", "CAN", "MEX", "GBR", "DEU", "FRA", "AUS", "JPN",
};

std::string zeroPadded(std::int64_t value, std::size_t width) {
  std::string digits = std::to_string(value);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return digits;
}

}  // namespace

// -----------------------------------------------------------------------------
// customerId: "CUST-" + six digits
// -----------------------------------------------------------------------------
std::string CustomerDataGenerator::customerId() {
  return "CUST-" + std::to_string(rng_.uniformInt(100000, 999999));
}

// -----------------------------------------------------------------------------
// email: first.lastNN@domain
// -----------------------------------------------------------------------------
std::string CustomerDataGenerator::email() {
  std::string address(pickOne(rng_, kFirstNames));
  address += '.';
  address += pickOne(rng_, kLastNames);
  address += zeroPadded(rng_.uniformInt(0, 99), 2);
  address += '@';
  address += pickOne(rng_, kMailDomains);
  return address;
}

// -----------------------------------------------------------------------------
// shippingAddress: house number + street, city, state, zip, country
// -----------------------------------------------------------------------------
domain::ShippingAddress CustomerDataGenerator::shippingAddress() {
  domain::ShippingAddress address;

  address.street = std::to_string(rng_.uniformInt(1, 9999));
  address.street += ' ';
  address.street += pickOne(rng_, kStreetNames);
  address.street += ' ';
  address.street += pickOne(rng_, kStreetSuffixes);

  address.city = std::string(pickOne(rng_, kCities));
  address.state = std::string(pickOne(rng_, kStateCodes));
  address.zip_code = zeroPadded(rng_.uniformInt(501, 99950), 5);
  address.country = std::string(pickOne(rng_, kCountryCodes));
  return address;
}

}  // namespace orderflow
