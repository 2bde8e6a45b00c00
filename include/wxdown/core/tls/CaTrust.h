#pragma once
#include <filesystem>
#include <string>

namespace wxdown::core::tls {
// Default location of the mitmproxy root certificate.
std::filesystem::path default_ca_cert_path();

// True when the PEM certificate at ca_pem_path chains to the system trust
// store, i.e. the interception CA has been installed.
bool ca_installed(const std::filesystem::path& ca_pem_path);
bool ca_installed(const std::filesystem::path& ca_pem_path, const std::filesystem::path& trust_bundle);

// SHA-256 fingerprint, upper-case hex separated by ':'; empty on failure.
std::string ca_fingerprint_sha256(const std::filesystem::path& ca_pem_path);
}
