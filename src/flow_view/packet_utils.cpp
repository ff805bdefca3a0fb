#include "packet_utils.hpp"

#include <cstring>

constexpr uint64_t MS_PER_SECOND = 1000;
constexpr uint64_t US_PER_MS = 1000;

bool get_payload_info(const struct pcap_pkthdr* h, const u_char* bytes, PayloadInfo& out)
{
    const size_t caplen = h->caplen;
    if (caplen < sizeof(struct ether_header))
    {
        return false;
    }
    const struct ether_header* eth = reinterpret_cast<const struct ether_header*>(bytes);
    uint16_t eth_type = ntohs(eth->ether_type);
    size_t offset = sizeof(struct ether_header);

    // VLAN
    if (eth_type == ETHERTYPE_VLAN)
    {
        if (caplen < offset + 4)
        {
            return false;
        }
        uint16_t inner;
        std::memcpy(&inner, bytes + offset + 2, sizeof(inner));
        eth_type = ntohs(inner);
        offset += 4;
    }
    if (eth_type != ETHERTYPE_IP)
    {
        return false;
    }
    if (caplen < offset + sizeof(struct ip))
    {
        return false;
    }

    const struct ip* ip = reinterpret_cast<const struct ip*>(bytes + offset);
    if (ip->ip_v != 4 || ip->ip_p != IPPROTO_TCP)
    {
        return false;
    }

    uint16_t ip_off = ntohs(ip->ip_off);
    if ((ip_off & 0x1fff) != 0 || (ip_off & IP_MF) != 0)
    {
        return false;  // fragmented
    }

    size_t ip_header_len = static_cast<size_t>(ip->ip_hl) * 4;
    if (ip_header_len < 20)
    {
        return false;
    }
    if (caplen < offset + ip_header_len + sizeof(struct tcphdr))
    {
        return false;
    }

    const struct tcphdr* tcp =
        reinterpret_cast<const struct tcphdr*>(bytes + offset + ip_header_len);
    size_t tcp_header_len = static_cast<size_t>(tcp->th_off) * 4;
    if (tcp_header_len < 20)
    {
        return false;
    }
    size_t payload_offset = offset + ip_header_len + tcp_header_len;
    if (payload_offset > caplen)
    {
        return false;
    }

    // Trust the IP total length over the capture length (Ethernet padding)
    size_t payload_len = caplen - payload_offset;
    size_t ip_total = ntohs(ip->ip_len);
    if (ip_total >= ip_header_len + tcp_header_len)
    {
        size_t ip_payload = ip_total - ip_header_len - tcp_header_len;
        if (ip_payload < payload_len)
        {
            payload_len = ip_payload;
        }
    }

    out.payload_offset = payload_offset;
    out.payload_len = payload_len;
    out.eth_type = eth_type;
    out.ip = ip;
    out.tcp = tcp;
    out.srcport = ntohs(tcp->th_sport);
    out.dstport = ntohs(tcp->th_dport);
    out.seq = ntohl(tcp->th_seq);
    out.flags = tcp->th_flags;

    std::memset(out.src, 0, sizeof(out.src));
    std::memset(out.dst, 0, sizeof(out.dst));
    inet_ntop(AF_INET, &ip->ip_src, out.src, sizeof(out.src));
    inet_ntop(AF_INET, &ip->ip_dst, out.dst, sizeof(out.dst));

    return true;
}

uint64_t timestamp_ms(const struct pcap_pkthdr* h)
{
    return static_cast<uint64_t>(h->ts.tv_sec) * MS_PER_SECOND +
           static_cast<uint64_t>(h->ts.tv_usec) / US_PER_MS;
}

ConnectionKey ConnectionKey::from(const PayloadInfo& pi)
{
    ConnectionKey key;
    std::string src(pi.src);
    std::string dst(pi.dst);

    // Normalize so that both directions produce the same key
    int cmp = src.compare(dst);
    bool swap = cmp > 0 || (cmp == 0 && pi.srcport > pi.dstport);
    if (swap)
    {
        key.addr_a = dst;
        key.port_a = pi.dstport;
        key.addr_b = src;
        key.port_b = pi.srcport;
    }
    else
    {
        key.addr_a = src;
        key.port_a = pi.srcport;
        key.addr_b = dst;
        key.port_b = pi.dstport;
    }
    return key;
}

std::string to_string(const ConnectionKey& key)
{
    return key.addr_a + ":" + std::to_string(key.port_a) + "<->" + key.addr_b + ":" +
           std::to_string(key.port_b);
}
