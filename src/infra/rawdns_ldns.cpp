#include "rg/prober.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include <sys/time.h>

#ifdef HAVE_LDNS
#include <ldns/ldns.h>
#endif

namespace rg
{
std::chrono::milliseconds per_server_timeout(const std::chrono::milliseconds total, const std::size_t servers)
{
    if (servers <= 1) return total;
    const auto share = total / static_cast<std::chrono::milliseconds::rep>(servers);
    return std::max(share, std::chrono::milliseconds(1));
}

LdnsProber::LdnsProber(std::string resolv_conf)
    : resolv_conf_(std::move(resolv_conf))
{
}

#ifdef HAVE_LDNS
namespace
{
std::string rdf_to_string(const ldns_rdf *rdf)
{
    if (!rdf) return {};
    std::string out;
    if (char *s = ldns_rdf2str(rdf))
    {
        out = s;
        LDNS_FREE(s);
    }
    return out;
}

std::string first_address(const ldns_pkt *pkt)
{
    ldns_rr_list *ans = ldns_pkt_answer(pkt);
    const size_t n = ans ? ldns_rr_list_rr_count(ans) : 0;
    for (size_t i = 0; i < n; ++i)
    {
        ldns_rr *rr = ldns_rr_list_rr(ans, i);
        const ldns_rr_type t = ldns_rr_get_type(rr);
        if ((t == LDNS_RR_TYPE_A || t == LDNS_RR_TYPE_AAAA) && ldns_rr_rd_count(rr) > 0)
            return rdf_to_string(ldns_rr_rdf(rr, 0));
    }
    return {};
}

ProbeStatus classify(ldns_status st, double ms, std::chrono::milliseconds timeout)
{
    switch (st)
    {
        // ldns reports an expired wait as a network error; elapsed time tells them apart
        case LDNS_STATUS_NETWORK_ERR:
            return ms >= 0.9 * static_cast<double>(timeout.count())
                       ? ProbeStatus::Timeout
                       : ProbeStatus::Unreachable;
        case LDNS_STATUS_SOCKET_ERROR:
        case LDNS_STATUS_ADDRESS_ERR:
        case LDNS_STATUS_RES_NO_NS:
            return ProbeStatus::Unreachable;
        default:
            return ProbeStatus::Failed;
    }
}
} // namespace
#endif

ProbeResult LdnsProber::resolve(const ProbeTarget &target,
                                const std::string &domain,
                                std::chrono::milliseconds timeout)
{
    ProbeResult out{};
    out.provider_id = target.provider_id;
    out.target_domain = domain;
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        auto t1 = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(t1 - t0).count();
    };

#ifndef HAVE_LDNS
    (void) timeout;
    out.ms = elapsed();
    out.status = ProbeStatus::NotAvailable;
    out.error = "ldns not available: rebuild with ldns (pkg-config ldns) to enable probing";
    return out;
#else
    ldns_resolver *res = nullptr;
    ldns_status st = LDNS_STATUS_OK;

    if (target.servers.empty())
    {
        st = ldns_resolver_new_frm_file(&res, resolv_conf_.empty() ? nullptr : resolv_conf_.c_str());
    }
    else
    {
        res = ldns_resolver_new();
        if (!res) st = LDNS_STATUS_MEM_ERR;
        for (size_t i = 0; res && i < target.servers.size() && st == LDNS_STATUS_OK; ++i)
        {
            const std::string &ns = target.servers[i];
            ldns_rdf *ns_rdf = ns.find(':') != std::string::npos
                                   ? ldns_rdf_new_frm_str(LDNS_RDF_TYPE_AAAA, ns.c_str())
                                   : ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, ns.c_str());
            if (!ns_rdf)
            {
                st = LDNS_STATUS_SYNTAX_RDATA_ERR;
                break;
            }
            st = ldns_resolver_push_nameserver(res, ns_rdf);
            ldns_rdf_deep_free(ns_rdf);
        }
    }

    if (st != LDNS_STATUS_OK || !res)
    {
        out.ms = elapsed();
        out.status = ProbeStatus::Failed;
        out.error = std::string("resolver init failed: ") + ldns_get_errorstr_by_id(st);
        if (res) ldns_resolver_deep_free(res);
        return out;
    }

    ldns_resolver_set_recursive(res, true);
    ldns_resolver_set_retry(res, 1);
    ldns_resolver_set_random(res, false);
    // a TCP retry after truncation would run past the budget
    ldns_resolver_set_fallback(res, false);
    // ldns waits the full timeout on every nameserver it tries
    const auto budget = per_server_timeout(timeout, ldns_resolver_nameserver_count(res));
    struct timeval tv{
        .tv_sec = static_cast<time_t>(budget.count() / 1000),
        .tv_usec = static_cast<suseconds_t>((budget.count() % 1000) * 1000)
    };
    ldns_resolver_set_timeout(res, tv);
    ldns_resolver_set_edns_udp_size(res, 1232);

    ldns_rdf *name = ldns_dname_new_frm_str(domain.c_str());
    if (!name)
    {
        out.ms = elapsed();
        out.status = ProbeStatus::Failed;
        out.error = "invalid domain name '" + domain + "'";
        ldns_resolver_deep_free(res);
        return out;
    }

    ldns_pkt *pkt = nullptr;
    st = ldns_resolver_query_status(&pkt, res, name, LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, LDNS_RD);
    out.ms = elapsed();

    if (st != LDNS_STATUS_OK || !pkt)
    {
        out.status = classify(st, out.ms, budget);
        out.error = ldns_get_errorstr_by_id(st);
        if (pkt) ldns_pkt_free(pkt);
        ldns_rdf_deep_free(name);
        ldns_resolver_deep_free(res);
        return out;
    }

    out.answered_by = rdf_to_string(ldns_pkt_answerfrom(pkt));
    const ldns_pkt_rcode rcode = ldns_pkt_get_rcode(pkt);
    if (rcode != LDNS_RCODE_NOERROR)
    {
        out.status = ProbeStatus::Failed;
        out.error = "rcode " + std::to_string(static_cast<int>(rcode));
    }
    else
    {
        out.resolved_address = first_address(pkt);
        out.success = !out.resolved_address.empty();
        out.status = out.success ? ProbeStatus::Ok : ProbeStatus::Failed;
        if (!out.success) out.error = "no address in answer";
    }

    ldns_pkt_free(pkt);
    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);
    return out;
#endif
}
} // namespace rg
