/**
 * @file ShareLink.h
 * @brief Receive links and local address discovery
 */

#pragma once

#include <cstdint>
#include <string>

namespace PeerDrop {

/**
 * @brief Query string that switches a device into receive mode
 */
constexpr const char* SHARE_RECEIVE_QUERY = "?mode=receive";

/**
 * @brief Build the origin a receiver reaches this device at
 * @return "http://<host>:<port>"
 */
std::string buildShareOrigin(const std::string& host, uint16_t port);

/**
 * @brief Link handed to the receiving device
 * @return origin + "?mode=receive"
 */
std::string buildShareUrl(const std::string& origin);

/**
 * @brief Check for a private-range IPv4 address
 *
 * Accepts 10.0.0.0/8, 172.16.0.0/12 and 192.168.0.0/16 in dotted-quad form.
 */
bool isPrivateIpv4(const std::string& address);

/**
 * @brief First private IPv4 address of an up, non-loopback interface
 * @return The address, or "localhost" if there is none
 */
std::string getLocalIpAddress();

}  // namespace PeerDrop
