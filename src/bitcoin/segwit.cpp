/**
 * @file segwit.cpp
 * @brief Реализация segwit программ
 */

#include "segwit.hpp"
#include "bech32.hpp"
#include "../core/constants.hpp"

namespace btcaddr::bitcoin::segwit {

bool convert_bits(Bytes& out, ByteSpan in, int from_bits, int to_bits, bool pad) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t max_v = (1u << to_bits) - 1;
    const uint32_t max_acc = (1u << (from_bits + to_bits - 1)) - 1;

    for (auto value : in) {
        if (value >> from_bits) {
            return false;
        }
        acc = ((acc << from_bits) | value) & max_acc;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v)) {
        return false;
    }

    return true;
}

bool is_valid_program_length(uint8_t witness_version, std::size_t length) noexcept {
    if (witness_version == 0) {
        return length == constants::P2WPKH_PROGRAM_SIZE || length == constants::P2WSH_PROGRAM_SIZE;
    }
    return length >= constants::MIN_WITNESS_PROGRAM_SIZE && length <= constants::MAX_WITNESS_PROGRAM_SIZE;
}

Result<SegwitProgram> extract(ByteSpan data_groups) {
    if (data_groups.empty()) {
        return Err<SegwitProgram>(ErrorCode::InvalidProgramLength, "Нет witness версии");
    }

    SegwitProgram result;
    result.witness_version = data_groups[0];
    if (result.witness_version > constants::MAX_WITNESS_VERSION) {
        return Err<SegwitProgram>(
            ErrorCode::InvalidWitnessVersion,
            "Witness версия больше 16: " + std::to_string(result.witness_version)
        );
    }

    if (!convert_bits(result.program, data_groups.subspan(1), 5, 8, false)) {
        return Err<SegwitProgram>(ErrorCode::PaddingError);
    }

    if (!is_valid_program_length(result.witness_version, result.program.size())) {
        return Err<SegwitProgram>(
            ErrorCode::InvalidProgramLength,
            "Длина программы " + std::to_string(result.program.size()) +
            " байт недопустима для witness v" + std::to_string(result.witness_version)
        );
    }

    return result;
}

Result<std::string> encode_address(std::string_view hrp, uint8_t witness_version, ByteSpan program) {
    if (witness_version > constants::MAX_WITNESS_VERSION) {
        return Err<std::string>(ErrorCode::InvalidWitnessVersion);
    }
    if (!is_valid_program_length(witness_version, program.size())) {
        return Err<std::string>(ErrorCode::InvalidProgramLength);
    }

    Bytes data{witness_version};
    if (!convert_bits(data, program, 8, 5, true)) {
        return Err<std::string>(ErrorCode::PaddingError);
    }

    auto variant = witness_version == 0 ? bech32::Variant::Bech32 : bech32::Variant::Bech32m;
    return bech32::encode(hrp, data, variant);
}

} // namespace btcaddr::bitcoin::segwit
