#include "preflight.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <platform/digest.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>
#include <sstream>

std::vector<PreflightIssue> check_local_dependencies() {
    std::vector<PreflightIssue> issues;

    if (!platform::tar_supported()) {
        issues.push_back({"libarchive cannot read or write tar streams",
                          "Install a libarchive build with tar support"});
    }
    if (!platform::filter_supported(platform::ArchiveFilter::Gzip)) {
        issues.push_back({"libarchive has no native gzip support",
                          "Install libarchive built with zlib"});
    }
    if (!platform::filter_supported(platform::ArchiveFilter::Zstd)) {
        issues.push_back({"libarchive has no native zstd support; gzip will be used",
                          "Install libarchive built with libzstd", true});
    }
    if (!platform::md5_available()) {
        issues.push_back({"OpenSSL provides no MD5 digest",
                          "Use an OpenSSL build with the default provider"});
    }

    return issues;
}

Result<std::set<std::string>> find_missing_remote_tools(SSHConnection& conn,
                                                        const std::vector<std::string>& tools) {
    std::string list;
    for (const auto& t : tools) {
        if (!list.empty()) list += " ";
        list += shell_quote(t);
    }
    std::string cmd = "for t in " + list +
                      "; do command -v \"$t\" >/dev/null 2>&1 || echo \"$t\"; done";
    auto r = conn.run(cmd);
    nimbus_log_ssh("probe-tools", cmd, r);
    if (r.failed()) {
        return Result<std::set<std::string>>::Err("Remote tool probe failed: " + r.get_output());
    }

    std::set<std::string> missing;
    std::istringstream in(strip_cr(r.stdout_data));
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (!line.empty()) missing.insert(line);
    }
    return Result<std::set<std::string>>::Ok(missing);
}

void require_clean(const std::vector<PreflightIssue>& issues) {
    std::string msg;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            nimbus_log("preflight hint: " + issue.message);
            continue;
        }
        if (!msg.empty()) msg += "; ";
        msg += issue.message + " (" + issue.fix + ")";
    }
    if (!msg.empty()) {
        throw NimbusError(ErrorKind::DependencyMissing, msg);
    }
}
