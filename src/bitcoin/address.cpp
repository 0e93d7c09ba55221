/**
 * @file address.cpp
 * @brief Реализация классификации Bitcoin адресов
 *
 * Алгоритм для segwit адресов (BIP-173, BIP-350):
 * 1. Структурный разбор bech32 строки
 * 2. Выбор варианта контрольной суммы по witness версии
 * 3. Проверка контрольной суммы только этим вариантом
 * 4. Извлечение witness программы
 */

#include "address.hpp"
#include "base58.hpp"
#include "base58check.hpp"
#include "bech32.hpp"
#include "segwit.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <string>

namespace btcaddr::bitcoin {

namespace {

/**
 * @brief Ошибка возникла после успешной проверки контрольной суммы
 *
 * Такая ошибка - надёжное доказательство того, что строка является
 * bech32 адресом, и она важнее ошибок Base58 пути.
 */
constexpr bool is_post_checksum_error(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidProgramLength:
        case ErrorCode::InvalidWitnessVersion:
        case ErrorCode::PaddingError:
        case ErrorCode::UnsupportedWitnessVersion:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Проверить контрольную сумму хотя бы одним вариантом
 *
 * Нужна только там, где witness версию определить нельзя.
 */
bool verifies_under_any_variant(const bech32::Bech32Decoded& decoded) {
    auto values = decoded.data_with_checksum();
    return bech32::verify_checksum(decoded.hrp, values, bech32::Variant::Bech32) ||
           bech32::verify_checksum(decoded.hrp, values, bech32::Variant::Bech32m);
}

/**
 * @brief Строка записана в форме bech32 адреса
 *
 * HRP legacy адреса начинается с '1' или '3' и не совпадает с HRP сети,
 * а Base58 строка другой длины не может быть legacy адресом.
 */
bool is_bech32_form(std::string_view address) {
    auto sep_pos = address.rfind(constants::BECH32_SEPARATOR);
    if (sep_pos == std::string_view::npos) {
        return false;
    }

    std::string hrp(address.substr(0, sep_pos));
    std::transform(hrp.begin(), hrp.end(), hrp.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    if (network_from_hrp(hrp) != Network::Unknown) {
        return true;
    }

    auto raw = base58::decode(address);
    return !raw || raw->size() != constants::LEGACY_ADDRESS_SIZE;
}

} // anonymous namespace

// =============================================================================
// Публичные функции
// =============================================================================

Result<DecodedAddress> decode_segwit_address(std::string_view address) {
    auto decoded = bech32::decode(address);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    // Без данных нет witness версии, а значит и варианта
    if (decoded->data.empty()) {
        if (!verifies_under_any_variant(*decoded)) {
            return Err<DecodedAddress>(ErrorCode::ChecksumMismatch);
        }
        return Err<DecodedAddress>(ErrorCode::InvalidProgramLength, "Пустая часть данных");
    }

    const uint8_t witness_version = decoded->data[0];
    if (witness_version > constants::MAX_WITNESS_VERSION) {
        if (!verifies_under_any_variant(*decoded)) {
            return Err<DecodedAddress>(ErrorCode::ChecksumMismatch);
        }
        return Err<DecodedAddress>(
            ErrorCode::InvalidWitnessVersion,
            "Witness версия больше 16: " + std::to_string(witness_version)
        );
    }

    // v0 - только Bech32, v1+ - только Bech32m, без попытки второго варианта
    const auto variant = witness_version == 0 ? bech32::Variant::Bech32 : bech32::Variant::Bech32m;
    if (!bech32::verify_checksum(decoded->hrp, decoded->data_with_checksum(), variant)) {
        return Err<DecodedAddress>(
            ErrorCode::ChecksumMismatch,
            "Контрольная сумма не сходится для варианта " + std::string(bech32::to_string(variant))
        );
    }

    auto program = segwit::extract(decoded->data);
    if (!program) {
        return std::unexpected(program.error());
    }

    DecodedAddress result;
    switch (program->witness_version) {
        case 0:
            result.type = AddressType::SegwitV0;
            break;
        case constants::TAPROOT_WITNESS_VERSION:
            result.type = AddressType::Taproot;
            break;
        default:
            return Err<DecodedAddress>(
                ErrorCode::UnsupportedWitnessVersion,
                "Witness v" + std::to_string(program->witness_version) + " не имеет назначенного типа"
            );
    }

    result.version = program->witness_version;
    result.payload = std::move(program->program);
    result.reason = ErrorCode::Success;
    result.network = network_from_hrp(decoded->hrp);
    result.hrp = std::move(decoded->hrp);
    return result;
}

DecodedAddress classify(std::string_view address, const ClassifierOptions& options) {
    if (address.empty()) {
        return DecodedAddress::invalid(ErrorCode::Empty);
    }

    // Длиннее любого адреса обеих схем
    if (address.size() > constants::BECH32_MAX_LENGTH) {
        return DecodedAddress::invalid(ErrorCode::TooLong);
    }

    // Legacy путь: известная версия - окончательный ответ
    auto legacy = base58check::validate(address);
    if (legacy) {
        return std::move(*legacy);
    }

    auto segwit = decode_segwit_address(address);
    if (segwit) {
        if (options.require_known_network && segwit->network == Network::Unknown) {
            return DecodedAddress::invalid(ErrorCode::UnknownNetwork);
        }
        return std::move(*segwit);
    }

    const ErrorCode legacy_error = legacy.error().code;
    const ErrorCode segwit_error = segwit.error().code;

    if (is_post_checksum_error(segwit_error)) {
        return DecodedAddress::invalid(segwit_error);
    }

    // Регистр проверяется до контрольной суммы: её результат здесь не важен
    if (segwit_error == ErrorCode::MixedCase && is_bech32_form(address)) {
        return DecodedAddress::invalid(segwit_error);
    }

    // Строка целиком из алфавита Base58: отказ Base58Check содержательнее
    if (legacy_error != ErrorCode::InvalidCharacter) {
        return DecodedAddress::invalid(legacy_error);
    }

    // Разделитель найден: строка похожа на bech32
    if (segwit_error != ErrorCode::NoSeparator) {
        return DecodedAddress::invalid(segwit_error);
    }

    return DecodedAddress::invalid(ErrorCode::NotRecognized);
}

bool is_valid_address(std::string_view address) {
    return classify(address).is_valid();
}

Network get_network_from_address(std::string_view address) {
    return classify(address).network;
}

} // namespace btcaddr::bitcoin
