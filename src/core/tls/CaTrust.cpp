#include "wxdown/core/tls/CaTrust.h"
#include "wxdown/core/util/Logger.h"
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace wxdown::core::tls {
using util::log_debug;

namespace {
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct StoreDeleter { void operator()(X509_STORE* p) const { X509_STORE_free(p); } };
struct StoreCtxDeleter { void operator()(X509_STORE_CTX* p) const { X509_STORE_CTX_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

X509Ptr load_pem(const std::filesystem::path& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return nullptr;
    X509Ptr cert(PEM_read_X509(f, nullptr, nullptr, nullptr));
    std::fclose(f);
    if (!cert) ERR_clear_error();
    return cert;
}

bool verify_against(X509* cert, X509_STORE* store) {
    std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter> ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store, cert, nullptr) != 1) return false;
    int rc = X509_verify_cert(ctx.get());
    if (rc != 1) {
        log_debug(fmt::format("CA not trusted: {}", X509_verify_cert_error_string(X509_STORE_CTX_get_error(ctx.get()))));
        ERR_clear_error();
    }
    return rc == 1;
}
}

std::filesystem::path default_ca_cert_path() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
    return base / ".mitmproxy" / "mitmproxy-ca-cert.pem";
}

bool ca_installed(const std::filesystem::path& ca_pem_path) {
    auto cert = load_pem(ca_pem_path);
    if (!cert) return false;
    std::unique_ptr<X509_STORE, StoreDeleter> store(X509_STORE_new());
    if (!store || X509_STORE_set_default_paths(store.get()) != 1) return false;
    return verify_against(cert.get(), store.get());
}

bool ca_installed(const std::filesystem::path& ca_pem_path, const std::filesystem::path& trust_bundle) {
    auto cert = load_pem(ca_pem_path);
    if (!cert) return false;
    std::unique_ptr<X509_STORE, StoreDeleter> store(X509_STORE_new());
    if (!store || X509_STORE_load_locations(store.get(), trust_bundle.c_str(), nullptr) != 1) {
        ERR_clear_error();
        return false;
    }
    return verify_against(cert.get(), store.get());
}

std::string ca_fingerprint_sha256(const std::filesystem::path& ca_pem_path) {
    auto cert = load_pem(ca_pem_path);
    if (!cert) return {};
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int n = 0;
    if (!X509_digest(cert.get(), EVP_sha256(), md, &n)) return {};
    std::string fp; fp.reserve(n * 3);
    static const char* h = "0123456789ABCDEF";
    for (unsigned i = 0; i < n; ++i) {
        unsigned char b = md[i];
        fp.push_back(h[b >> 4]); fp.push_back(h[b & 0xF]);
        if (i + 1 < n) fp.push_back(':');
    }
    return fp;
}
}
