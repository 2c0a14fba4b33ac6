// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fees/fee_rate.h"

#include "core/serialize.h"
#include "core/stream.h"

namespace fees {

std::string FeeRateEstimate::to_string() const {
    return "fast=" + std::to_string(fast) +
           " medium=" + std::to_string(medium) +
           " slow=" + std::to_string(slow);
}

std::vector<uint8_t> FeeRateEstimate::encode() const {
    core::ByteWriter stream(RECORD_SIZE);
    core::ser_write_u8(stream, RECORD_VERSION);
    core::ser_write_u64(stream, fast);
    core::ser_write_u64(stream, medium);
    core::ser_write_u64(stream, slow);
    return stream.release();
}

core::Result<FeeRateEstimate> FeeRateEstimate::decode(
    std::span<const uint8_t> data) {

    if (data.size() != RECORD_SIZE) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "fee estimate record has " + std::to_string(data.size()) +
            " bytes, expected " + std::to_string(RECORD_SIZE));
    }

    core::ByteReader reader(data);
    uint8_t version = core::ser_read_u8(reader);
    if (version != RECORD_VERSION) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "unknown fee estimate record version " +
            std::to_string(version));
    }

    FeeRateEstimate est;
    est.fast   = core::ser_read_u64(reader);
    est.medium = core::ser_read_u64(reader);
    est.slow   = core::ser_read_u64(reader);
    return est;
}

} // namespace fees
