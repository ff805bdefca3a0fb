#ifndef PACKET_UTILS_HPP
#define PACKET_UTILS_HPP

#include <arpa/inet.h>
#include <net/ethernet.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <pcap.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

struct PayloadInfo
{
    size_t payload_offset;
    size_t payload_len;
    uint16_t eth_type;
    const struct ip* ip;
    const struct tcphdr* tcp;
    char src[INET_ADDRSTRLEN];
    char dst[INET_ADDRSTRLEN];
    uint16_t srcport;
    uint16_t dstport;
    uint32_t seq;    // host order
    uint8_t flags;   // TH_* bits
};

// Direction-independent identity of a TCP connection: the lower address:port
// pair is always stored as endpoint a, so both directions map to one key.
struct ConnectionKey
{
    std::string addr_a;
    uint16_t port_a{0};
    std::string addr_b;
    uint16_t port_b{0};

    static ConnectionKey from(const PayloadInfo& pi);

    bool operator<(const ConnectionKey& other) const
    {
        return std::tie(addr_a, port_a, addr_b, port_b) <
               std::tie(other.addr_a, other.port_a, other.addr_b, other.port_b);
    }

    bool operator==(const ConnectionKey& other) const
    {
        return addr_a == other.addr_a && port_a == other.port_a && addr_b == other.addr_b &&
               port_b == other.port_b;
    }
};

std::string to_string(const ConnectionKey& key);

// Returns true if the frame is Ethernet (optionally VLAN tagged) -> IPv4 ->
// TCP, unfragmented, and fills `out`. Bounds are checked against h->caplen.
bool get_payload_info(const struct pcap_pkthdr* h, const u_char* bytes, PayloadInfo& out);

// Capture timestamp in milliseconds since the epoch
uint64_t timestamp_ms(const struct pcap_pkthdr* h);

#endif  // PACKET_UTILS_HPP
