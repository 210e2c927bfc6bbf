// share_routes.cc
//
// HTTP surface of the playlist share store.
//
// This file is transport only: request shaping (rate limits, reuse-by-id,
// caching headers) and the mapping of store results to status codes. All
// storage semantics live in ShareStore.
//
//   POST /api/playlist-share          create (201) or reuse (200)
//   GET  /api/playlist-share/<id>     read, weak ETag, long-lived public cache
//   POST /api/playlist-share/revoke   revoke with edit token
//
// Error responses are JSON {ok:false, error:<code>, message:<text>} with
// Cache-Control: no-store. Every response carries X-Robots-Tag: noindex.

#include "share_routes.h"

#include "envelope.h"
#include "plshare_util.h"
#include "rate_limiter.h"
#include "share_store.h"
#include "store_error.h"

#include <iostream>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

const char* kRobots = "noindex, nofollow";
const char* kSharedCacheControl =
    "public, max-age=300, s-maxage=86400, stale-while-revalidate=604800, immutable";

// Uniform JSON response helper: application/json + no-store.
void reply_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_header("X-Robots-Tag", kRobots);
    res.set_content(body, "application/json; charset=utf-8");
}

void reply_error(httplib::Response& res, int status, const std::string& code, const std::string& message) {
    reply_json(res, status, json({{"ok", false}, {"error", code}, {"message", message}}).dump());
}

bool parse_json_body(const httplib::Request& req, json& out, std::string& err) {
    try {
        if (req.body.empty()) { err = "empty_body"; return false; }
        out = json::parse(req.body);
        if (!out.is_object()) { err = "json_must_be_object"; return false; }
        return true;
    } catch (const std::exception& e) {
        err = std::string("json_parse_error: ") + e.what();
        return false;
    }
}

std::string header_or_empty(const httplib::Request& req, const char* name) {
    return req.has_header(name) ? plshare::trim_ascii(req.get_header_value(name)) : std::string();
}

std::string json_string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return plshare::trim_ascii(it->get<std::string>());
}

std::string public_origin_for(const ShareRoutesContext& ctx, const httplib::Request& req) {
    if (ctx.public_origin && !ctx.public_origin->empty()) return *ctx.public_origin;

    std::string host = header_or_empty(req, "X-Forwarded-Host");
    if (host.empty()) host = header_or_empty(req, "Host");

    std::string proto = header_or_empty(req, "X-Forwarded-Proto");
    auto comma = proto.find(',');
    if (comma != std::string::npos) proto = plshare::trim_ascii(proto.substr(0, comma));
    if (proto.empty()) proto = "https";

    if (host.empty()) return "";
    return proto + "://" + host;
}

std::string share_url(const ShareRoutesContext& ctx, const httplib::Request& req, const std::string& share_id) {
    return public_origin_for(ctx, req) + "/playlists/shared/" + share_id;
}

// StoreError -> HTTP status
int status_for(plshare::StoreErrc c) {
    switch (c) {
        case plshare::StoreErrc::validation: return 400;
        case plshare::StoreErrc::quota:      return 507;
        case plshare::StoreErrc::collision:  return 500;
        case plshare::StoreErrc::integrity:  return 500;
        case plshare::StoreErrc::io:         return 500;
    }
    return 500;
}

void handle_create(const ShareRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    const std::string ip = plshare::share_client_ip(req);
    if (!ctx.create_limiter->allow(ip)) {
        reply_error(res, 429, "rate_limited", "Too many share requests. Please try again later.");
        return;
    }

    json body;
    std::string perr;
    if (!parse_json_body(req, body, perr)) {
        reply_error(res, 400, "bad_request", "Invalid JSON body.");
        return;
    }

    auto enc = body.find("encrypted");
    if (enc == body.end() || !enc->is_object()) {
        reply_error(res, 400, "bad_request", "encrypted payload is required.");
        return;
    }

    try {
        const plshare::EncryptedEnvelope envelope = plshare::envelope_from_json(*enc);
        const std::string content_hash = plshare::normalize_content_hash(json_string_field(body, "contentHash"));

        bool revocable = false;
        auto rv = body.find("revocable");
        if (rv != body.end() && rv->is_boolean()) revocable = rv->get<bool>();

        const std::string reuse_id = json_string_field(body, "reuseShareId");
        if (plshare::is_share_id(reuse_id) && ctx.store->reuse_share(reuse_id, content_hash)) {
            reply_json(res, 200, json({
                {"mode", "server"},
                {"shareId", reuse_id},
                {"url", share_url(ctx, req, reuse_id)},
                {"reused", true},
                {"contentHash", content_hash},
            }).dump());
            return;
        }

        if (!ctx.write_limiter->allow("")) {
            reply_error(res, 429, "rate_limited", "Share writes are rate-limited. Please retry shortly.");
            return;
        }

        const plshare::CreateShareResult r = ctx.store->create_share(envelope, content_hash, revocable);

        json out = {
            {"mode", "server"},
            {"shareId", r.share_id},
            {"url", share_url(ctx, req, r.share_id)},
            {"reused", false},
            {"contentHash", r.content_hash},
        };
        if (r.edit_token) out["editToken"] = *r.edit_token;
        reply_json(res, 201, out.dump());
    } catch (const plshare::StoreError& e) {
        const int status = status_for(e.code());
        if (status >= 500) {
            std::cerr << "[http] ERROR: POST /api/playlist-share failed ("
                      << plshare::store_errc_str(e.code()) << "): " << e.what() << std::endl;
        }
        if (e.code() == plshare::StoreErrc::quota) {
            reply_error(res, status, "quota_exceeded", "Playlist share storage limit exceeded.");
        } else if (e.code() == plshare::StoreErrc::collision) {
            reply_error(res, status, "share_id_exhausted", "Failed to reserve a share id.");
        } else if (status == 400) {
            reply_error(res, status, "bad_request", e.what());
        } else {
            reply_error(res, status, "server_error", "Failed to create share link.");
        }
    } catch (const std::exception& e) {
        std::cerr << "[http] ERROR: POST /api/playlist-share failed: " << e.what() << std::endl;
        reply_error(res, 500, "server_error", "Failed to create share link.");
    }
}

void handle_read(const ShareRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    const std::string share_id = plshare::trim_ascii(req.matches[1].str());
    if (share_id.empty()) {
        reply_error(res, 400, "bad_request", "Missing share id.");
        return;
    }

    try {
        auto rec = ctx.store->read_share(share_id);
        if (!rec) {
            reply_error(res, 404, "not_found", "Shared playlist not found.");
            return;
        }

        const std::string etag = plshare::share_weak_etag(rec->share_id, rec->created_at);
        res.set_header("Cache-Control", kSharedCacheControl);
        res.set_header("X-Robots-Tag", kRobots);
        res.set_header("ETag", etag);

        if (plshare::if_none_match_hits(header_or_empty(req, "If-None-Match"), etag)) {
            res.status = 304;
            return;
        }

        json out = {
            {"version", 1},
            {"shareId", rec->share_id},
            {"createdAt", rec->created_at},
            {"encrypted", plshare::envelope_to_json(rec->envelope)},
        };
        res.status = 200;
        res.set_content(out.dump(), "application/json; charset=utf-8");
    } catch (const std::exception& e) {
        std::cerr << "[http] ERROR: GET /api/playlist-share/" << share_id << " failed: " << e.what() << std::endl;
        res.headers.clear();
        reply_error(res, 500, "server_error", "Failed to load shared playlist.");
    }
}

void handle_revoke(const ShareRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    json body;
    std::string perr;
    if (!parse_json_body(req, body, perr)) {
        reply_error(res, 400, "bad_request", "Invalid JSON body.");
        return;
    }

    const std::string share_id = json_string_field(body, "shareId");
    const std::string token = json_string_field(body, "editToken");
    if (share_id.empty() || token.empty()) {
        reply_error(res, 400, "bad_request", "shareId and editToken are required.");
        return;
    }

    try {
        switch (ctx.store->revoke_share(share_id, token)) {
            case plshare::RevokeResult::ok:
                reply_json(res, 200, json({{"ok", true}}).dump());
                return;
            case plshare::RevokeResult::already_revoked:
                reply_json(res, 200, json({{"ok", true}, {"alreadyRevoked", true}}).dump());
                return;
            case plshare::RevokeResult::not_found:
                reply_error(res, 404, "not_found", "Shared playlist not found.");
                return;
            case plshare::RevokeResult::forbidden:
                reply_error(res, 403, "forbidden", "Invalid edit token for this share.");
                return;
            case plshare::RevokeResult::unsupported:
                reply_error(res, 400, "unsupported", "This shared link cannot be revoked.");
                return;
        }
        reply_error(res, 500, "server_error", "Failed to revoke share link.");
    } catch (const std::exception& e) {
        std::cerr << "[http] ERROR: POST /api/playlist-share/revoke failed: " << e.what() << std::endl;
        reply_error(res, 500, "server_error", "Failed to revoke share link.");
    }
}

} // namespace

namespace plshare {

std::string share_weak_etag(const std::string& share_id, const std::string& created_at) {
    const std::string raw = share_id + ":" + created_at;
    return "W/\"" + b64url_enc(reinterpret_cast<const unsigned char*>(raw.data()), raw.size()) + "\"";
}

bool if_none_match_hits(const std::string& header, const std::string& etag) {
    const std::string raw = trim_ascii(header);
    if (raw.empty()) return false;
    if (raw == "*") return true;

    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) comma = raw.size();
        if (trim_ascii(raw.substr(start, comma - start)) == etag) return true;
        start = comma + 1;
    }
    return false;
}

std::string share_client_ip(const httplib::Request& req) {
    std::string xff = req.has_header("X-Forwarded-For") ? trim_ascii(req.get_header_value("X-Forwarded-For")) : "";
    if (!xff.empty()) {
        std::string first = trim_ascii(xff.substr(0, xff.find(',')));
        return first.empty() ? "unknown" : first;
    }
    std::string real = req.has_header("X-Real-IP") ? trim_ascii(req.get_header_value("X-Real-IP")) : "";
    if (!real.empty()) return real;
    return req.remote_addr.empty() ? "unknown" : req.remote_addr;
}

} // namespace plshare

void register_share_routes(httplib::Server& srv, const ShareRoutesContext& ctx) {
    srv.Post("/api/playlist-share", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_create(ctx, req, res);
    });

    srv.Post("/api/playlist-share/revoke", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_revoke(ctx, req, res);
    });

    srv.Get(R"(/api/playlist-share/([A-Za-z0-9_-]+))", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_read(ctx, req, res);
    });
}
