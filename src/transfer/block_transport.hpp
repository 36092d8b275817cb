#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "manifest.hpp"

// Moves blocks from the side that holds them to the destination and tells
// which blocks the destination does not yet hold intact.
class BlockTransport {
public:
    virtual ~BlockTransport() = default;

    // Manifest names that are absent or mismatched at the destination, in
    // manifest order. Recomputed on every call.
    virtual std::vector<std::string> find_invalid(const Manifest& manifest) = 0;

    // Copy one block to the destination, overwriting whatever is there.
    // Safe to call from several threads at once.
    virtual Result<void> copy_block(const std::string& name) = 0;
};
