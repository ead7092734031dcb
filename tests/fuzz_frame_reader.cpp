// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
//
// libFuzzer harness for walpush::parse_wal and walpush::decode_chunk.
// Build with: cmake -DWALPUSH_BUILD_FUZZ=ON (clang)
// Run with:   ./build/fuzz_frame_reader corpus/wal -max_total_time=60

#include "walpush.h"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::span<const uint8_t> input(data, size);

    try {
        walpush::parse_wal(input);
    } catch (const walpush::Error&) {
        // CorruptFrame or an unsupported format version.
    }

    try {
        walpush::decode_chunk(input);
    } catch (const walpush::Error&) {
        // Expected for malformed input.
    }

    return 0;
}
