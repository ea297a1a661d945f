#include "cr/mdns.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

#include <ldns/ldns.h>

namespace cr
{
std::string canonical_name(const std::string &name)
{
    std::string out = name;
    std::ranges::transform(
        out,
        out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.empty() || out.back() != '.') out.push_back('.');
    return out;
}

static std::string rdf_name(const ldns_rdf *rdf)
{
    if (!rdf) return {};
    std::string out;
    if (char *s = ldns_rdf2str(rdf))
    {
        out = s;
        LDNS_FREE(s);
    }
    return out.empty() ? out : canonical_name(out);
}

// Top bit of the class field on answers (RFC 6762 10.2).
static bool cache_flush(const ldns_rr *rr)
{
    return (static_cast<unsigned>(ldns_rr_get_class(rr)) & 0x8000u) != 0;
}

std::vector<std::uint8_t> build_mdns_query(const std::string &name, int qtype)
{
    std::vector<std::uint8_t> out;
    ldns_rdf *qname = ldns_dname_new_frm_str(name.c_str());
    if (!qname) return out;

    // mDNS queries: id 0, no RD; the packet takes ownership of qname
    ldns_pkt *pkt = ldns_pkt_query_new(
        qname,
        static_cast<ldns_rr_type>(qtype),
        LDNS_RR_CLASS_IN,
        0);
    if (!pkt)
    {
        ldns_rdf_deep_free(qname);
        return out;
    }
    ldns_pkt_set_id(pkt, 0);

    uint8_t *wire = nullptr;
    size_t size = 0;
    if (ldns_pkt2wire(&wire, pkt, &size) == LDNS_STATUS_OK && wire)
    {
        out.assign(wire, wire + size);
    }
    if (wire) LDNS_FREE(wire);
    ldns_pkt_free(pkt);
    return out;
}

MdnsRecordCache::MdnsRecordCache(std::string browse_type)
    : browse_type_(canonical_name(browse_type))
{}

DiscoveryEvent MdnsRecordCache::make_event(DiscoveryEventKind kind,
                                           const std::string &instance) const
{
    DiscoveryEvent ev{};
    ev.kind = kind;
    ev.service_type = browse_type_;
    ev.service_name = instance;
    return ev;
}

std::vector<DiscoveryEvent> MdnsRecordCache::ingest(const std::uint8_t *data,
                                                    std::size_t len,
                                                    Clock::time_point now)
{
    std::vector<DiscoveryEvent> raw;
    ldns_pkt *pkt = nullptr;
    if (!data || len == 0 || ldns_wire2pkt(&pkt, data, len) != LDNS_STATUS_OK || !pkt)
    {
        ++malformed_;
        return raw;
    }
    if (!ldns_pkt_qr(pkt))
    {
        // somebody else's query
        ldns_pkt_free(pkt);
        return raw;
    }

    for (ldns_rr_list *section: {ldns_pkt_answer(pkt), ldns_pkt_additional(pkt)})
    {
        const size_t count = section ? ldns_rr_list_rr_count(section) : 0;
        for (size_t i = 0; i < count; ++i)
        {
            const ldns_rr *rr = ldns_rr_list_rr(section, i);
            const std::string owner = rdf_name(ldns_rr_owner(rr));
            const std::uint32_t ttl = ldns_rr_ttl(rr);
            switch (ldns_rr_get_type(rr))
            {
                case LDNS_RR_TYPE_PTR:
                    if (ldns_rr_rd_count(rr) >= 1)
                        on_ptr(owner, rdf_name(ldns_rr_rdf(rr, 0)), ttl, now, raw);
                    break;
                case LDNS_RR_TYPE_SRV:
                    if (ldns_rr_rd_count(rr) >= 4)
                        on_srv(owner,
                               rdf_name(ldns_rr_rdf(rr, 3)),
                               ldns_rdf2native_int16(ldns_rr_rdf(rr, 2)),
                               ttl, now, raw);
                    break;
                case LDNS_RR_TYPE_A:
                    if (ldns_rr_rd_count(rr) >= 1)
                    {
                        const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
                        if (rdf && ldns_rdf_size(rdf) == 4)
                        {
                            Ipv4Bytes ip{};
                            std::memcpy(ip.data(), ldns_rdf_data(rdf), 4);
                            on_a(owner, ip, ttl, cache_flush(rr), now, raw);
                        }
                    }
                    break;
                default:
                    break;
            }
        }
    }
    ldns_pkt_free(pkt);

    // A packet announcing an instance usually carries its SRV/A as well:
    // one Added is enough, drop the Updated that the same packet implied.
    std::vector<DiscoveryEvent> out;
    out.reserve(raw.size());
    for (const auto &ev: raw)
    {
        const bool dup = std::ranges::any_of(
            out,
            [&](const DiscoveryEvent &o)
            {
                return o.service_name == ev.service_name &&
                       (o.kind == ev.kind ||
                        (ev.kind == DiscoveryEventKind::Updated &&
                         o.kind == DiscoveryEventKind::Added));
            });
        if (!dup) out.push_back(ev);
    }
    return out;
}

void MdnsRecordCache::on_ptr(const std::string &owner,
                             const std::string &instance,
                             std::uint32_t ttl,
                             Clock::time_point now,
                             std::vector<DiscoveryEvent> &out)
{
    if (owner != browse_type_ || instance.empty()) return;
    if (ttl == 0)
    {
        // goodbye packet
        if (instances_.erase(instance) > 0)
            out.push_back(make_event(DiscoveryEventKind::Removed, instance));
        return;
    }
    const auto expires = now + std::chrono::seconds(ttl);
    auto [it, inserted] = instances_.try_emplace(instance, expires);
    if (inserted)
    {
        out.push_back(make_event(DiscoveryEventKind::Added, instance));
    }
    else
    {
        it->second = expires;
    }
}

void MdnsRecordCache::on_srv(const std::string &owner,
                             const std::string &target,
                             std::uint16_t port,
                             std::uint32_t ttl,
                             Clock::time_point now,
                             std::vector<DiscoveryEvent> &out)
{
    if (owner.empty()) return;
    if (ttl == 0)
    {
        srv_.erase(owner);
        return;
    }
    const auto expires = now + std::chrono::seconds(ttl);
    auto it = srv_.find(owner);
    const bool changed = it == srv_.end() || it->second.expires <= now ||
                         it->second.target != target || it->second.port != port;
    srv_[owner] = Srv{target, port, expires};
    if (changed && instances_.contains(owner))
        out.push_back(make_event(DiscoveryEventKind::Updated, owner));
}

void MdnsRecordCache::on_a(const std::string &owner,
                           const Ipv4Bytes &ip,
                           std::uint32_t ttl,
                           bool flush,
                           Clock::time_point now,
                           std::vector<DiscoveryEvent> &out)
{
    if (owner.empty()) return;
    auto &list = addrs_[owner];
    auto it = std::ranges::find_if(list, [&](const Addr &a) { return a.ip == ip; });
    if (ttl == 0)
    {
        if (it != list.end()) list.erase(it);
        if (list.empty()) addrs_.erase(owner);
        return;
    }
    if (flush)
    {
        // a unique record replaces whatever the host announced more than a
        // second ago; those linger for one more second
        const auto grace = now + kCacheFlushGrace;
        for (auto &a: list)
        {
            if (a.ip != ip && a.received + kCacheFlushGrace <= now && a.expires > grace)
                a.expires = grace;
        }
    }
    const auto expires = now + std::chrono::seconds(ttl);
    if (it != list.end())
    {
        const bool was_live = it->expires > now;
        it->expires = expires;
        it->received = now;
        if (was_live) return;
    }
    else
    {
        list.push_back(Addr{ip, expires, now});
    }

    // a new address for a host changes every instance served by it
    for (const auto &[instance, srv]: srv_)
    {
        if (srv.target == owner && instances_.contains(instance))
            out.push_back(make_event(DiscoveryEventKind::Updated, instance));
    }
}

std::vector<DiscoveryEvent> MdnsRecordCache::expire(Clock::time_point now)
{
    std::vector<DiscoveryEvent> out;
    for (auto it = instances_.begin(); it != instances_.end();)
    {
        if (it->second <= now)
        {
            out.push_back(make_event(DiscoveryEventKind::Removed, it->first));
            it = instances_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    std::erase_if(srv_, [&](const auto &kv) { return kv.second.expires <= now; });
    for (auto it = addrs_.begin(); it != addrs_.end();)
    {
        std::erase_if(it->second, [&](const Addr &a) { return a.expires <= now; });
        it = it->second.empty() ? addrs_.erase(it) : std::next(it);
    }
    return out;
}

std::optional<std::string> MdnsRecordCache::srv_target(const std::string &instance,
                                                       Clock::time_point now) const
{
    auto it = srv_.find(canonical_name(instance));
    if (it == srv_.end() || it->second.expires <= now) return std::nullopt;
    return it->second.target;
}

std::optional<ResolvedService> MdnsRecordCache::lookup(const std::string &instance,
                                                       Clock::time_point now) const
{
    auto sit = srv_.find(canonical_name(instance));
    if (sit == srv_.end() || sit->second.expires <= now) return std::nullopt;
    auto ait = addrs_.find(sit->second.target);
    if (ait == addrs_.end()) return std::nullopt;

    ResolvedService svc{};
    svc.server = sit->second.target;
    svc.port = sit->second.port;
    std::vector<Addr> live;
    std::ranges::copy_if(ait->second, std::back_inserter(live),
                         [&](const Addr &a) { return a.expires > now; });
    std::ranges::stable_sort(live, std::ranges::greater{}, &Addr::received);
    for (const auto &a: live) svc.addresses.push_back(a.ip);
    if (svc.addresses.empty()) return std::nullopt;
    return svc;
}

bool MdnsRecordCache::has_instance(const std::string &instance) const
{
    return instances_.contains(canonical_name(instance));
}

void MdnsRecordCache::clear()
{
    instances_.clear();
    srv_.clear();
    addrs_.clear();
}
} // namespace cr
