#include "ledger_ngin/instruments/option_symbol.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ledger_ngin {

namespace {

constexpr size_t kDateDigits = 6;
constexpr size_t kStrikeDigits = 8;
constexpr size_t kMaxUnderlyingLength = 6;
constexpr double kStrikeScale = 1000.0;

bool all_digits(const std::string& text) {
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !text.empty();
}

Result<OptionContract> invalid_symbol(const std::string& symbol, const std::string& why) {
    return make_error<OptionContract>(ErrorCode::CONFIGURATION_ERROR,
                                      "Unparseable option symbol '" + symbol + "': " + why,
                                      "OptionSymbol");
}

}  // namespace

std::string OptionContract::describe() const {
    std::ostringstream ss;
    ss << underlying << " " << month_abbreviation(expiration.month) << " " << expiration.day
       << " " << expiration.year << " $";
    if (std::floor(strike) == strike) {
        ss << static_cast<long long>(strike);
    } else {
        ss << std::fixed << std::setprecision(2) << strike;
    }
    ss << " " << option_type_to_string(type);
    return ss.str();
}

Result<OptionContract> parse_option_symbol(const std::string& symbol) {
    const size_t suffix_length = kDateDigits + 1 + kStrikeDigits;
    if (symbol.size() <= suffix_length) {
        return invalid_symbol(symbol, "too short");
    }

    const size_t underlying_length = symbol.size() - suffix_length;
    if (underlying_length > kMaxUnderlyingLength) {
        return invalid_symbol(symbol, "underlying longer than 6 characters");
    }

    const std::string underlying = symbol.substr(0, underlying_length);
    for (char c : underlying) {
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return invalid_symbol(symbol, "underlying must be upper-case letters");
        }
    }

    const std::string date_part = symbol.substr(underlying_length, kDateDigits);
    const char type_char = symbol[underlying_length + kDateDigits];
    const std::string strike_part = symbol.substr(underlying_length + kDateDigits + 1);

    if (!all_digits(date_part)) {
        return invalid_symbol(symbol, "expiration must be YYMMDD");
    }
    if (type_char != 'C' && type_char != 'P') {
        return invalid_symbol(symbol, "type must be C or P");
    }
    if (strike_part.size() != kStrikeDigits || !all_digits(strike_part)) {
        return invalid_symbol(symbol, "strike must be 8 digits");
    }

    OptionContract contract;
    contract.underlying = underlying;
    contract.expiration = Date(2000 + std::stoi(date_part.substr(0, 2)),
                               std::stoi(date_part.substr(2, 2)),
                               std::stoi(date_part.substr(4, 2)));
    if (!is_valid_date(contract.expiration)) {
        return invalid_symbol(symbol, "expiration is not a calendar date");
    }
    contract.type = type_char == 'C' ? OptionType::CALL : OptionType::PUT;
    contract.strike = std::stoll(strike_part) / kStrikeScale;

    return Result<OptionContract>(contract);
}

std::string format_option_symbol(const OptionContract& contract) {
    std::ostringstream ss;
    ss << contract.underlying << std::setfill('0') << std::setw(2)
       << (contract.expiration.year % 100) << std::setw(2) << contract.expiration.month
       << std::setw(2) << contract.expiration.day
       << (contract.type == OptionType::CALL ? 'C' : 'P') << std::setw(8)
       << std::llround(contract.strike * kStrikeScale);
    return ss.str();
}

}  // namespace ledger_ngin
