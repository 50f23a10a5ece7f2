#include "proof/types.hpp"
#include "proof/proof_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>

namespace pous {
namespace proof {

namespace {

std::string normalise_ip(const std::string& ip) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Location: Invalid IP address: " << ip;
    throw ProofError("Location: Invalid IP address: " + ip);
  }
  // IPv4-mapped IPv6 addresses name the same endpoint as the IPv4 form
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6()).to_string();
  }
  return address.to_string();
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

//==============================================
// NETWORK LOCATION
//==============================================

Bytes NetworkLocation::canonical_encoding() const {
  std::string encoded = normalise_ip(ip) + "|" + std::to_string(port) + "|" +
                        (hostname ? lower(*hostname) : std::string());
  return Bytes(encoded.begin(), encoded.end());
}

std::string NetworkLocation::to_string() const {
  std::string result = ip.find(':') != std::string::npos
    ? "[" + ip + "]:" + std::to_string(port)
    : ip + ":" + std::to_string(port);
  if (hostname) {
    result += " (" + *hostname + ")";
  }
  return result;
}

NetworkLocation NetworkLocation::parse(const std::string& endpoint) {
  size_t colon_pos = endpoint.rfind(':');
  if (colon_pos == std::string::npos || colon_pos + 1 == endpoint.size()) {
    throw ProofError("Location: Invalid endpoint format, expected ip:port: " + endpoint);
  }

  std::string host = endpoint.substr(0, colon_pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  NetworkLocation location;
  location.ip = host;
  try {
    unsigned long port = std::stoul(endpoint.substr(colon_pos + 1));
    if (port == 0 || port > 65535) {
      throw ProofError("Location: Port out of range: " + endpoint);
    }
    location.port = static_cast<uint16_t>(port);
  } catch (const std::logic_error&) {
    throw ProofError("Location: Invalid port in endpoint: " + endpoint);
  }

  // Validates the address
  normalise_ip(location.ip);
  return location;
}

bool NetworkLocation::operator==(const NetworkLocation& other) const {
  try {
    return canonical_encoding() == other.canonical_encoding();
  } catch (const ProofError&) {
    // Unparsable addresses never match anything
    return false;
  }
}

std::string node_id_for(const PublicKey& public_key) {
  return crypto::to_hex(crypto::sha256(public_key.data(), public_key.size()));
}

} // namespace proof
} // namespace pous
