#include "LinkProbe.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <stdexcept>

#include <arpa/inet.h>
#include <net/if.h>

#include <netlink/netlink.h>
#include <netlink/cache.h>
#include <netlink/addr.h>
#include <netlink/route/route.h>
#include <netlink/route/link.h>
#include <netlink/route/neighbour.h>
#include <linux/neighbour.h>

namespace
{
    struct NlSock
    {
        nl_sock *sk {nullptr};
        NlSock()
        {
            sk = nl_socket_alloc();
            if (!sk) throw std::runtime_error("nl_socket_alloc failed");
            int rc = nl_connect(sk, NETLINK_ROUTE);
            if (rc < 0)
            {
                std::string msg = std::string("nl_connect: ") + nl_geterror(rc);
                nl_socket_free(sk);
                sk = nullptr;
                throw std::runtime_error(msg);
            }
        }
        ~NlSock() { if (sk) nl_socket_free(sk); }
        NlSock(const NlSock&)            = delete;
        NlSock& operator=(const NlSock&) = delete;
    };

    struct NlCache
    {
        nl_cache *c {nullptr};
        ~NlCache() { if (c) nl_cache_free(c); }
    };
}

namespace LinkProbe
{
    std::optional<std::string> find_default_oifname(int family)
    {
        LOGT("linkprobe") << "find_default_oifname: family=" << family;
        NlSock nl;
        NlCache rcache;
        NlCache lcache;

        int rc = rtnl_route_alloc_cache(nl.sk, family, 0, &rcache.c);
        if (rc < 0)
        {
            throw std::runtime_error(std::string("rtnl_route_alloc_cache: ") + nl_geterror(rc));
        }
        rc = rtnl_link_alloc_cache(nl.sk, AF_UNSPEC, &lcache.c);
        if (rc < 0)
        {
            throw std::runtime_error(std::string("rtnl_link_alloc_cache: ") + nl_geterror(rc));
        }

        int oif = 0;
        for (nl_object *it = nl_cache_get_first(rcache.c); it; it = nl_cache_get_next(it))
        {
            auto *r = reinterpret_cast<rtnl_route *>(it);
            nl_addr *dst = rtnl_route_get_dst(r);
            const bool is_default = (dst == nullptr) || (nl_addr_get_prefixlen(dst) == 0);
            if (!is_default || rtnl_route_get_table(r) != RT_TABLE_MAIN)
            {
                continue;
            }
            if (rtnl_route_get_nnexthops(r) > 0)
            {
                rtnl_nexthop *nh = rtnl_route_nexthop_n(r, 0);
                if (nh && (oif = rtnl_route_nh_get_ifindex(nh)) > 0)
                {
                    break;
                }
            }
        }

        if (oif <= 0)
        {
            return std::nullopt;
        }

        std::string name;
        if (rtnl_link *link = rtnl_link_get(lcache.c, oif))
        {
            if (const char *n = rtnl_link_get_name(link)) name = n;
            rtnl_link_put(link);
        }
        if (name.empty())
        {
            return std::nullopt;
        }
        LOGD("linkprobe") << "find_default_oifname: oifname=" << name;
        return name;
    }

    std::vector<std::string> list_neighbours_v4(const std::string &ifname)
    {
        const int ifindex = static_cast<int>(::if_nametoindex(ifname.c_str()));
        if (ifindex <= 0)
        {
            return {};
        }

        NlSock nl;
        NlCache ncache;
        const int rc = rtnl_neigh_alloc_cache(nl.sk, &ncache.c);
        if (rc < 0)
        {
            throw std::runtime_error(std::string("rtnl_neigh_alloc_cache: ") + nl_geterror(rc));
        }

        std::vector<std::string> out;
        for (nl_object *it = nl_cache_get_first(ncache.c); it; it = nl_cache_get_next(it))
        {
            auto *n = reinterpret_cast<rtnl_neigh *>(it);
            if (rtnl_neigh_get_ifindex(n) != ifindex || rtnl_neigh_get_family(n) != AF_INET)
            {
                continue;
            }
            const int state = rtnl_neigh_get_state(n);
            if (state & (NUD_FAILED | NUD_INCOMPLETE | NUD_NOARP))
            {
                continue;
            }
            nl_addr *dst = rtnl_neigh_get_dst(n);
            if (!dst || nl_addr_get_len(dst) != 4)
            {
                continue;
            }
            char buf[INET_ADDRSTRLEN] = {};
            if (::inet_ntop(AF_INET, nl_addr_get_binary_addr(dst), buf, sizeof(buf)))
            {
                out.emplace_back(buf);
            }
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }
}
