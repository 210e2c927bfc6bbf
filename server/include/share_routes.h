#pragma once
#include <httplib.h>

#include <string>

namespace plshare {
class ShareStore;
class RateLimiter;
} // namespace plshare

// Everything is owned by main.cpp; the routes only borrow.
struct ShareRoutesContext {
    plshare::ShareStore* store = nullptr;

    plshare::RateLimiter* create_limiter = nullptr; // per client ip
    plshare::RateLimiter* write_limiter  = nullptr; // global, key ""

    // "" => derive from X-Forwarded-Host/Host + X-Forwarded-Proto
    const std::string* public_origin = nullptr;
};

namespace plshare {
// W/"<base64url(shareId:createdAt)>"
std::string share_weak_etag(const std::string& share_id, const std::string& created_at);
// If-None-Match: "*" or a comma-separated list containing etag
bool if_none_match_hits(const std::string& header, const std::string& etag);
// First X-Forwarded-For entry, then X-Real-IP, then the socket peer.
std::string share_client_ip(const httplib::Request& req);
} // namespace plshare

//   POST /api/playlist-share
//   GET  /api/playlist-share/<shareId>
//   POST /api/playlist-share/revoke
void register_share_routes(httplib::Server& srv, const ShareRoutesContext& ctx);
