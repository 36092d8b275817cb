#include "codec.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const CodecInfo& codec_info(CodecKind kind) {
    static const CodecInfo ZSTD{
        CodecKind::Zstd, "zstd", ".zst",
        "zstd -q -f --rm", "zstd -q -d -c",
        platform::ArchiveFilter::Zstd};
    static const CodecInfo GZIP{
        CodecKind::Gzip, "gzip", ".gz",
        "gzip -f", "gzip -d -c",
        platform::ArchiveFilter::Gzip};
    return kind == CodecKind::Zstd ? ZSTD : GZIP;
}

CodecProbe local_codec_probe() {
    return [](const std::string& name) {
        if (name == "zstd") return platform::filter_supported(platform::ArchiveFilter::Zstd);
        if (name == "gzip") return platform::filter_supported(platform::ArchiveFilter::Gzip);
        return false;
    };
}

std::vector<CodecKind> codec_candidates(const std::string& preference) {
    if (preference == "zstd") return {CodecKind::Zstd};
    if (preference == "gzip") return {CodecKind::Gzip};
    return {CodecKind::Zstd, CodecKind::Gzip};
}

CodecInfo select_codec(const std::string& preference,
                       const CodecProbe& local_ok,
                       const CodecProbe& remote_ok) {
    std::string tried;
    for (CodecKind kind : codec_candidates(preference)) {
        const CodecInfo& info = codec_info(kind);
        bool local = local_ok && local_ok(info.name);
        bool remote = !remote_ok || remote_ok(info.name);
        nimbus_log(fmt::format("codec probe {}: local={} remote={}", info.name, local, remote));
        if (local && remote) return info;

        if (!tried.empty()) tried += ", ";
        tried += info.name;
        if (!local) tried += " (local)";
        if (!remote) tried += " (remote)";
    }
    throw NimbusError(ErrorKind::DependencyMissing,
                      "No usable compressor on both sides; unavailable: " + tried);
}
