// plshare_report: operator view of a share store root.
//
//   plshare_report [--verify-audit] [--sweep-orphans <seconds>]
//
// Uses the same PLSHARE_* configuration as the server. Exit code 0 on
// success, 1 when any requested step fails.

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <sodium.h>

#include "audit_log.h"
#include "blob_gc.h"
#include "blob_store.h"
#include "share_links.h"
#include "storage_report.h"
#include "store_config.h"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--verify-audit] [--sweep-orphans <seconds>]" << std::endl;
}

int main(int argc, char** argv)
{
    bool verify_audit = false;
    long long sweep_age = -1;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--verify-audit") == 0) {
            verify_audit = true;
        } else if (std::strcmp(argv[i], "--sweep-orphans") == 0 && i + 1 < argc) {
            char* end = nullptr;
            sweep_age = std::strtoll(argv[++i], &end, 10);
            if (!end || *end != '\0' || sweep_age < 0) {
                usage(argv[0]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    plshare::StoreConfig cfg;
    std::string err;
    if (!plshare::load_store_config(&cfg, &err)) {
        std::cerr << "[settings] FATAL: " << err << std::endl;
        return 1;
    }

    plshare::LinkStore links(cfg.data_dir);
    plshare::BlobStore blobs(cfg.data_dir);

    plshare::StorageReport rep;
    if (!plshare::build_storage_report(cfg.data_dir, links, &rep, &err)) {
        std::cerr << "Failed to build playlist share report: " << err << std::endl;
        return 1;
    }
    std::cout << plshare::format_storage_report(rep);

    int rc = 0;

    if (verify_audit) {
        auto vr = plshare::AuditLog::verify(cfg.audit_jsonl_path());
        if (vr.ok) {
            std::cout << "Audit chain: OK (" << vr.lines << " lines)" << std::endl;
        } else {
            std::cout << "Audit chain: BROKEN at line " << vr.first_bad_line << ": " << vr.error << std::endl;
            rc = 1;
        }
    }

    if (sweep_age >= 0) {
        plshare::AuditLog audit(cfg.audit_jsonl_path(), cfg.audit_state_path());
        plshare::BlobCollector gc(links, blobs, &audit);
        auto sr = gc.sweep_orphans(std::chrono::seconds(sweep_age));
        std::cout << "Orphan sweep: scanned=" << sr.blobs_scanned
                  << " referenced=" << sr.referenced
                  << " too_young=" << sr.too_young
                  << " removed=" << sr.removed
                  << " (" << plshare::bytes_to_human(sr.removed_bytes) << ")" << std::endl;
        if (!sr.ok) {
            std::cout << "Orphan sweep: ABORTED: " << sr.error << std::endl;
            rc = 1;
        }
    }

    return rc;
}
