#include "local_transport.hpp"

LocalTransport::LocalTransport(fs::path source_dir, fs::path dest_dir)
    : source_dir_(std::move(source_dir)), dest_dir_(std::move(dest_dir)) {
}

std::vector<std::string> LocalTransport::find_invalid(const Manifest& manifest) {
    return verify_local_blocks(manifest, dest_dir_);
}

Result<void> LocalTransport::copy_block(const std::string& name) {
    std::error_code ec;
    fs::copy_file(source_dir_ / name, dest_dir_ / name,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void>::Err("copy " + name + ": " + ec.message());
    }
    return Result<void>::Ok();
}
