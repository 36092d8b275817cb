#pragma once

#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>

class SSHConnection;

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Local capabilities every job needs: tar and gzip support in libarchive,
// MD5 in OpenSSL. Returns empty vector if everything is good.
std::vector<PreflightIssue> check_local_dependencies();

// Ask the remote host which of `tools` do not resolve via `command -v`.
Result<std::set<std::string>> find_missing_remote_tools(SSHConnection& conn,
                                                        const std::vector<std::string>& tools);

// Throws NimbusError(DependencyMissing) listing every non-hint issue.
void require_clean(const std::vector<PreflightIssue>& issues);
